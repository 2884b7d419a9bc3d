#include "purchase_finalizer.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace seating {

PurchaseFinalizer::PurchaseFinalizer(SeatStore& store, const Clock& clock)
    : store_(store), clock_(clock) {}

FinalizeResult PurchaseFinalizer::complete_purchase(const SessionId& session_id,
                                                    const EventId& event_id,
                                                    const OrderId& order_id,
                                                    const CustomerInfo& customer) {
    if (session_id.empty() || event_id.empty() || order_id.empty()) {
        return FinalizeResult{false, ErrorCode::kInvalidRequest,
                              "Session, event and order ids must not be empty", {}, {}};
    }

    const Timestamp now = clock_.now();
    const std::vector<SeatHold> holds = store_.holds_for_session(session_id, event_id);

    std::vector<HoldId> live_ids;
    std::set<SeatId> live_seats;
    Timestamp checkout_start = Timestamp::max();
    for (const auto& h : holds) {
        if (is_live(h, now)) {
            live_ids.push_back(h.id);
            live_seats.insert(h.seat_id);
            checkout_start = std::min(checkout_start, h.held_at);
        }
    }

    // Lapsed holds whose seat the session no longer covers.
    std::vector<const SeatHold*> lapsed;
    for (const auto& h : holds) {
        if (is_lapsed(h, now) && live_seats.count(h.seat_id) == 0) {
            lapsed.push_back(&h);
        }
    }

    std::set<SeatId> expired;
    if (!live_ids.empty()) {
        // Anything that lapsed while the oldest live hold existed belongs to
        // this checkout; holds that lapsed before it were abandoned.
        for (const SeatHold* h : lapsed) {
            if (h->expires_at > checkout_start) expired.insert(h->seat_id);
        }
    } else if (!lapsed.empty()) {
        const SeatHold* latest = *std::max_element(lapsed.begin(), lapsed.end(),
            [](const SeatHold* a, const SeatHold* b) {
                if (a->held_at != b->held_at) return a->held_at < b->held_at;
                return a->batch_id < b->batch_id;
            });
        for (const SeatHold* h : lapsed) {
            if (h->batch_id == latest->batch_id) expired.insert(h->seat_id);
        }
    } else {
        return FinalizeResult{false, ErrorCode::kHoldNotFound,
                              "No active holds for session " + session_id, {}, {}};
    }

    if (!expired.empty()) {
        std::vector<SeatId> ids(expired.begin(), expired.end());
        spdlog::info("Purchase {} for session {} rejected: {} held seats expired",
                     order_id, session_id, ids.size());
        return FinalizeResult{false, ErrorCode::kPartialExpiry,
                              "Holds expired; re-hold the listed seats", {}, ids};
    }

    SaleRequest sale;
    sale.event_id = event_id;
    sale.session_id = session_id;
    sale.order_id = order_id;
    sale.hold_ids = live_ids;
    sale.now = now;

    CommitResult commit = store_.commit_sale(sale);
    if (!commit.success && !commit.missing_hold_ids.empty()) {
        spdlog::warn("Purchase {} for session {}: {} holds vanished before commit",
                     order_id, session_id, commit.missing_hold_ids.size());
        return FinalizeResult{false, ErrorCode::kHoldNotFound,
                              "Hold not found: " + commit.missing_hold_ids.front(), {}, {}};
    }
    if (!commit.success) {
        spdlog::info("Purchase {} for session {} lost a race with expiry on {} seats",
                     order_id, session_id, commit.expired_seat_ids.size());
        return FinalizeResult{false, ErrorCode::kPartialExpiry,
                              "Holds expired; re-hold the listed seats", {}, commit.expired_seat_ids};
    }

    spdlog::info("Order {} finalized {} seats for session {} event {} (customer {})",
                 order_id, commit.seat_ids.size(), session_id, event_id,
                 customer.email.empty() ? "-" : customer.email);
    return FinalizeResult{true, ErrorCode::kNone, "Purchase completed", commit.seat_ids, {}};
}

} // namespace seating
