#pragma once

#include <string>
#include <vector>

#include "clock.hpp"
#include "seat_store.hpp"

namespace seating {

/**
 * @brief Buyer details forwarded with a completed purchase.
 *
 * The engine only logs them; ticket issuance is done by the order system.
 */
struct CustomerInfo {
    std::string email;
    std::string name;
    std::string payment_method;
};

/**
 * @brief Result of complete_purchase().
 */
struct FinalizeResult {
    bool success;
    ErrorCode error;
    std::string message;
    std::vector<SeatId> seat_ids;          /**< Sold seats, sorted (on success). */
    std::vector<SeatId> expired_seat_ids;  /**< Seats to re-hold (on kPartialExpiry). */
};

/**
 * @brief Converts a session's live holds into sold seats, all or none.
 *
 * Which holds take part:
 * - every live hold of the session at the event is purchased;
 * - a lapsed hold blocks the purchase when the session holds its seat by no
 *   other live hold and it lapsed after the oldest live hold was created,
 *   whichever hold_seats() call produced it. Holds that lapsed before that
 *   were abandoned and are ignored. If the session has no live hold at all,
 *   the lapsed holds of its most recent batch are reported instead.
 *
 * The actual write is one SeatStore::commit_sale() call, which re-validates
 * every hold at the same instant, so a hold lapsing between the read and the
 * write also fails the whole call.
 */
class PurchaseFinalizer {
public:
    PurchaseFinalizer(SeatStore& store, const Clock& clock);

    FinalizeResult complete_purchase(const SessionId& session_id,
                                     const EventId& event_id,
                                     const OrderId& order_id,
                                     const CustomerInfo& customer);

private:
    SeatStore& store_;
    const Clock& clock_;
};

} // namespace seating
