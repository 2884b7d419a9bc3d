#include "hold_manager.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace seating {

namespace {

std::string join_ids(const std::vector<SeatId>& ids) {
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    return out;
}

HoldResult hold_failure(ErrorCode code, const std::string& message, std::vector<SeatId> blocked = {}) {
    return HoldResult{false, code, message, HoldBatch{}, std::move(blocked)};
}

} // namespace

HoldManager::HoldManager(const SeatCatalog& catalog, SeatStore& store, const Clock& clock, EngineConfig config)
    : catalog_(catalog), store_(store), clock_(clock), config_(std::move(config)) {}

HoldResult HoldManager::hold_seats(const std::vector<SeatId>& seat_ids,
                                   const EventId& event_id,
                                   const SessionId& session_id,
                                   int duration_minutes,
                                   const std::string& customer_email) {
    if (seat_ids.empty()) {
        return hold_failure(ErrorCode::kInvalidRequest, "No seats provided");
    }
    if (session_id.empty()) {
        return hold_failure(ErrorCode::kInvalidRequest, "Session id must not be empty");
    }
    if (event_id.empty()) {
        return hold_failure(ErrorCode::kInvalidRequest, "Event id must not be empty");
    }
    if (duration_minutes < 0) {
        return hold_failure(ErrorCode::kInvalidRequest, "Hold duration must be positive");
    }
    if (duration_minutes > config_.max_hold_minutes) {
        return hold_failure(ErrorCode::kInvalidRequest,
                            "Hold duration exceeds " + std::to_string(config_.max_hold_minutes) + " minutes");
    }
    const int minutes = duration_minutes == 0 ? config_.hold_duration_minutes : duration_minutes;

    // Fixed total order for acquisition.
    std::vector<SeatId> sorted = seat_ids;
    std::sort(sorted.begin(), sorted.end());
    auto dup = std::adjacent_find(sorted.begin(), sorted.end());
    if (dup != sorted.end()) {
        return hold_failure(ErrorCode::kInvalidRequest, "Duplicate seat id: " + *dup);
    }

    std::string err;
    std::vector<SeatId> blocked;
    const ErrorCode invalid = validate_seats_or_fail(sorted, event_id, err, blocked);
    if (invalid != ErrorCode::kNone) {
        return hold_failure(invalid, err, blocked);
    }

    const Timestamp now = clock_.now();

    // Pre-check so the caller learns every blocker, not only the first one hit.
    const std::map<SeatId, SeatState> taken = store_.query_seat_states(event_id, sorted, now);
    if (!taken.empty()) {
        for (const auto& kv : taken) blocked.push_back(kv.first);
        spdlog::info("Hold rejected for session {} event {}: seats taken [{}]",
                     session_id, event_id, join_ids(blocked));
        return hold_failure(ErrorCode::kSeatUnavailable,
                            "Seats not available: " + join_ids(blocked), blocked);
    }

    HoldBatch batch;
    batch.batch_id = ids_.batch_id(now);
    batch.expires_at = now + std::chrono::minutes(minutes);

    for (const auto& seat_id : sorted) {
        HoldRequest req;
        req.seat_id = seat_id;
        req.event_id = event_id;
        req.session_id = session_id;
        req.batch_id = batch.batch_id;
        req.customer_email = customer_email;
        req.now = now;
        req.expires_at = batch.expires_at;
        req.duration_minutes = minutes;

        AcquireResult r = acquire_with_retry(req);
        if (r.status != AcquireResult::Status::kAcquired) {
            // All-or-nothing: undo what this call already took.
            if (!batch.hold_ids.empty()) {
                HoldFilter undo;
                undo.hold_ids = batch.hold_ids;
                const std::size_t undone = store_.release_holds(undo, now);
                spdlog::debug("Rolled back {} holds of batch {}", undone, batch.batch_id);
            }
            spdlog::info("Hold lost race for session {} event {} on seat {}", session_id, event_id, seat_id);
            return hold_failure(ErrorCode::kSeatUnavailable, "Seat not available: " + seat_id, {seat_id});
        }
        batch.hold_ids.push_back(r.hold.id);
        batch.seat_ids.push_back(seat_id);
    }

    spdlog::info("Held {} seats [{}] for session {} event {} (batch {}, {} min)",
                 batch.seat_ids.size(), join_ids(batch.seat_ids), session_id, event_id,
                 batch.batch_id, minutes);
    return HoldResult{true, ErrorCode::kNone, "Held successfully", batch, {}};
}

ExtendResult HoldManager::extend_hold(const HoldId& hold_id, int additional_minutes) {
    if (additional_minutes <= 0) {
        return ExtendResult{false, ErrorCode::kInvalidRequest, "Extension must be positive", Timestamp{}};
    }
    if (additional_minutes > config_.max_hold_minutes) {
        return ExtendResult{false, ErrorCode::kInvalidRequest,
                            "Extension exceeds " + std::to_string(config_.max_hold_minutes) + " minutes", Timestamp{}};
    }

    const ExtendOutcome outcome = store_.extend_hold(hold_id, std::chrono::minutes(additional_minutes), clock_.now());
    switch (outcome) {
        case ExtendOutcome::kNotFound:
            return ExtendResult{false, ErrorCode::kHoldNotFound, "Hold not found: " + hold_id, Timestamp{}};
        case ExtendOutcome::kExpired:
            return ExtendResult{false, ErrorCode::kHoldExpired, "Hold expired: " + hold_id, Timestamp{}};
        case ExtendOutcome::kNotActive:
            return ExtendResult{false, ErrorCode::kHoldNotActive, "Hold is not active: " + hold_id, Timestamp{}};
        case ExtendOutcome::kExtended:
            break;
    }

    const std::optional<SeatHold> hold = store_.find_hold(hold_id);
    const Timestamp expires_at = hold ? hold->expires_at : Timestamp{};
    spdlog::info("Extended hold {} by {} min", hold_id, additional_minutes);
    return ExtendResult{true, ErrorCode::kNone, "Extended successfully", expires_at};
}

ReleaseResult HoldManager::release_holds(const HoldFilter& filter) {
    if (filter.empty()) {
        return ReleaseResult{false, ErrorCode::kInvalidRequest,
                             "Provide hold ids, a session id or an event id", 0};
    }
    const std::size_t released = store_.release_holds(filter, clock_.now());
    spdlog::info("Released {} holds (session={}, event={}, ids={})",
                 released,
                 filter.session_id ? *filter.session_id : "-",
                 filter.event_id ? *filter.event_id : "-",
                 filter.hold_ids ? filter.hold_ids->size() : 0);
    return ReleaseResult{true, ErrorCode::kNone, "Released " + std::to_string(released) + " holds", released};
}

std::vector<HoldStatusView> HoldManager::hold_status(const SessionId& session_id, const EventId& event_id) const {
    const Timestamp now = clock_.now();
    std::vector<HoldStatusView> out;

    for (const SeatHold& h : store_.holds_for_session(session_id, event_id)) {
        HoldStatusView v;
        v.hold_id = h.id;
        v.batch_id = h.batch_id;
        v.seat_id = h.seat_id;
        v.status = is_lapsed(h, now) ? HoldStatus::kExpired : h.status;
        v.held_at = h.held_at;
        v.expires_at = h.expires_at;
        if (is_live(h, now)) {
            v.minutes_remaining = static_cast<int>(
                std::chrono::duration_cast<std::chrono::minutes>(h.expires_at - now).count());
        }
        if (const Seat* seat = catalog_.find_seat(h.seat_id)) {
            v.section = seat->section;
            v.row = seat->row;
            v.number = seat->number;
        }
        out.push_back(std::move(v));
    }

    std::sort(out.begin(), out.end(), [](const HoldStatusView& a, const HoldStatusView& b) {
        if (a.held_at != b.held_at) return a.held_at < b.held_at;
        if (a.seat_id != b.seat_id) return a.seat_id < b.seat_id;
        return a.hold_id < b.hold_id;
    });
    return out;
}

std::string HoldManager::new_session_id() {
    return ids_.session_id(clock_.now());
}

ErrorCode HoldManager::validate_seats_or_fail(const std::vector<SeatId>& seat_ids,
                                              const EventId& event_id,
                                              std::string& out_error,
                                              std::vector<SeatId>& out_blocked) const {
    out_error.clear();
    out_blocked.clear();

    ChartId chart_id;
    for (const auto& id : seat_ids) {
        const Seat* seat = catalog_.find_seat(id);
        if (!seat) {
            out_error = "Seat not found: " + id;
            return ErrorCode::kSeatNotFound;
        }
        if (chart_id.empty()) {
            chart_id = seat->chart_id;
        } else if (seat->chart_id != chart_id) {
            out_error = "Seats belong to different charts";
            return ErrorCode::kInvalidRequest;
        }
        if (!catalog_.available_for_event(*seat, event_id)) {
            out_blocked.push_back(id);
        }
    }

    const ChartId bound = catalog_.chart_for_event(event_id);
    if (!bound.empty() && bound != chart_id) {
        out_error = "Seats do not belong to the chart of event " + event_id;
        return ErrorCode::kInvalidRequest;
    }

    if (!out_blocked.empty()) {
        out_error = "Seats not for sale: " + join_ids(out_blocked);
        return ErrorCode::kSeatUnavailable;
    }
    return ErrorCode::kNone;
}

AcquireResult HoldManager::acquire_with_retry(const HoldRequest& req) {
    std::chrono::milliseconds delay = config_.retry_base_delay();
    for (int attempt = 1; ; ++attempt) {
        AcquireResult r = store_.try_acquire_hold(req);
        if (r.status != AcquireResult::Status::kTransient) {
            return r;
        }
        if (attempt >= config_.retry_attempts) {
            spdlog::warn("Store contention on seat {} for event {}: giving up after {} attempts",
                         req.seat_id, req.event_id, attempt);
            return AcquireResult{AcquireResult::Status::kConflict, SeatHold{}};
        }
        spdlog::debug("Store contention on seat {} (attempt {}), retrying in {} ms",
                      req.seat_id, attempt, delay.count());
        std::this_thread::sleep_for(delay);
        delay *= 2;
    }
}

} // namespace seating
