#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "seat_types.hpp"

/**
 * @file seat_store.hpp
 * @brief Storage port for holds and sold-seat records.
 *
 * The store is the only shared mutable resource of the engine. Every
 * operation below is one atomic step against it (one storage round trip),
 * expressed as a conditional write:
 * - "insert a hold only if the seat is neither sold nor live-held"
 * - "set status X only if the current status is Y"
 *
 * A relational adapter implements these with conditional UPDATE/INSERT
 * statements; InMemorySeatStore implements them under a mutex.
 */

namespace seating {

/**
 * @brief Arguments of a conditional hold insert.
 */
struct HoldRequest {
    SeatId seat_id;
    EventId event_id;
    SessionId session_id;
    BatchId batch_id;
    std::string customer_email;
    Timestamp now;          /**< Instant used for lazy expiry of stale holds. */
    Timestamp expires_at;
    int duration_minutes = 0;
};

/**
 * @brief Outcome of a conditional hold insert.
 */
struct AcquireResult {
    enum class Status {
        kAcquired,  /**< Hold inserted. */
        kConflict,  /**< Seat sold or live-held by someone (including the same session). */
        kTransient  /**< Store contention; the caller may retry. */
    };

    Status status;
    SeatHold hold;  /**< The inserted hold (valid only when kAcquired). */
};

/**
 * @brief Conjunctive filter selecting holds to release.
 *
 * Unset fields do not constrain the match. An empty filter matches nothing.
 */
struct HoldFilter {
    std::optional<std::vector<HoldId>> hold_ids;
    std::optional<SessionId> session_id;
    std::optional<EventId> event_id;

    bool empty() const { return !hold_ids && !session_id && !event_id; }
};

/**
 * @brief Outcome of a conditional hold extension.
 */
enum class ExtendOutcome {
    kExtended,
    kNotFound,
    kExpired,   /**< Hold lapsed; it has been marked expired. */
    kNotActive  /**< Already extended, completed or cancelled. */
};

/**
 * @brief Arguments of an atomic sale commit.
 */
struct SaleRequest {
    EventId event_id;
    SessionId session_id;
    OrderId order_id;
    std::vector<HoldId> hold_ids;
    Timestamp now;
};

/**
 * @brief Outcome of an atomic sale commit.
 */
struct CommitResult {
    bool success;
    std::vector<SeatId> seat_ids;          /**< Sold seats, sorted (on success). */
    std::vector<SeatId> expired_seat_ids;  /**< Seats whose holds no longer qualify (on failure). */
    std::vector<HoldId> missing_hold_ids;  /**< Requested hold ids the store does not know (on failure). */
};

/**
 * @brief Abstract storage port.
 *
 * Implementations must make each method atomic with respect to every other
 * method. Callers never hold state of the store across calls.
 */
class SeatStore {
public:
    virtual ~SeatStore() = default;

    /**
     * @brief Inserts a hold if the seat is neither sold nor live-held.
     *
     * In the same atomic step, any open hold on (event, seat) whose expiry is
     * at or before @p req.now is transitioned to expired first.
     */
    virtual AcquireResult try_acquire_hold(const HoldRequest& req) = 0;

    /** @brief Current state of one seat (never kInactive: the store has no catalog). */
    virtual SeatState seat_state(const EventId& event_id, const SeatId& seat_id, Timestamp now) const = 0;

    /**
     * @brief States of the given seats that are sold or live-held.
     *
     * Seats absent from the returned map are free as far as the store knows.
     */
    virtual std::map<SeatId, SeatState> query_seat_states(const EventId& event_id,
                                                          const std::vector<SeatId>& seat_ids,
                                                          Timestamp now) const = 0;

    /**
     * @brief Cancels every live hold matching @p filter.
     *
     * Idempotent: holds that are already completed, cancelled or lapsed are not
     * counted. Lapsed open holds are marked expired on the way.
     * @return Number of holds cancelled by this call.
     */
    virtual std::size_t release_holds(const HoldFilter& filter, Timestamp now) = 0;

    /**
     * @brief Sets status extended and pushes expiry forward, only if the hold is active and live.
     */
    virtual ExtendOutcome extend_hold(const HoldId& hold_id,
                                      std::chrono::minutes additional,
                                      Timestamp now) = 0;

    /** @brief Ids of open holds whose expiry is at or before @p now. */
    virtual std::vector<HoldId> find_lapsed_holds(Timestamp now) const = 0;

    /**
     * @brief Marks holds expired, only those still open and lapsed at @p now.
     * @return Number of holds transitioned.
     */
    virtual std::size_t mark_expired(const std::vector<HoldId>& hold_ids, Timestamp now) = 0;

    /**
     * @brief Converts the given holds to sold records, all or none.
     *
     * Every hold must belong to the request's session and event and be live at
     * @p req.now. Otherwise nothing is written and the offending seats are
     * reported in CommitResult::expired_seat_ids; unknown hold ids go to
     * CommitResult::missing_hold_ids.
     */
    virtual CommitResult commit_sale(const SaleRequest& req) = 0;

    virtual std::optional<SeatHold> find_hold(const HoldId& hold_id) const = 0;

    /** @brief Every hold (any status) of a session at an event. */
    virtual std::vector<SeatHold> holds_for_session(const SessionId& session_id,
                                                    const EventId& event_id) const = 0;

    /** @brief Every sold record of an event, ordered by seat id. */
    virtual std::vector<SoldSeat> sold_seats(const EventId& event_id) const = 0;
};

} // namespace seating
