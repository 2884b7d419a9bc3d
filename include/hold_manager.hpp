#pragma once

#include <string>
#include <vector>

#include "clock.hpp"
#include "engine_config.hpp"
#include "id_generator.hpp"
#include "seat_catalog.hpp"
#include "seat_store.hpp"

/**
 * @file hold_manager.hpp
 * @brief Creation, extension and release of time-bound seat holds.
 *
 * Concurrency model:
 * - The manager keeps no seat state of its own; every decision is taken by a
 *   conditional write against the SeatStore, so several managers (threads or
 *   processes) can share one store.
 * - Seats of one batch are always acquired in lexicographic id order, so two
 *   overlapping multi-seat requests cannot wait on each other in a cycle.
 * - A batch is all-or-nothing: a failed acquisition releases every hold taken
 *   earlier in the same call.
 */

namespace seating {

/**
 * @brief Holds created by one successful hold_seats() call.
 */
struct HoldBatch {
    BatchId batch_id;              /**< Shared by every hold of the batch. */
    std::vector<HoldId> hold_ids;  /**< One per seat, in seat_ids order. */
    std::vector<SeatId> seat_ids;  /**< Held seats, sorted. */
    Timestamp expires_at;          /**< Common expiry of the batch. */
};

/**
 * @brief Result of hold_seats().
 */
struct HoldResult {
    bool success;                       /**< True if every requested seat is now held. */
    ErrorCode error;                    /**< kNone on success. */
    std::string message;                /**< Human-readable result description. */
    HoldBatch batch;                    /**< Valid only on success. */
    std::vector<SeatId> blocked_seat_ids; /**< Seats that prevented the batch (kSeatUnavailable). */
};

/**
 * @brief Result of extend_hold().
 */
struct ExtendResult {
    bool success;
    ErrorCode error;
    std::string message;
    Timestamp expires_at;  /**< New expiry (on success). */
};

/**
 * @brief Result of release_holds().
 */
struct ReleaseResult {
    bool success;          /**< False only for an invalid (empty) filter. */
    ErrorCode error;
    std::string message;
    std::size_t released;  /**< Holds cancelled by this call. */
};

/**
 * @brief One hold of a session as reported by hold_status().
 */
struct HoldStatusView {
    HoldId hold_id;
    BatchId batch_id;
    SeatId seat_id;
    std::string section;
    std::string row;
    int number = 0;
    HoldStatus status = HoldStatus::kActive; /**< Lapsed open holds are reported as kExpired. */
    Timestamp held_at;
    Timestamp expires_at;
    int minutes_remaining = 0;               /**< Whole minutes left, 0 once lapsed or closed. */
};

/**
 * @brief Hold lifecycle service.
 *
 * The catalog, store and clock are borrowed; they must outlive the manager.
 */
class HoldManager {
public:
    HoldManager(const SeatCatalog& catalog, SeatStore& store, const Clock& clock,
                EngineConfig config = EngineConfig());

    /**
     * @brief Holds every seat in @p seat_ids for @p session_id, or none of them.
     *
     * @param seat_ids Seats to hold; non-empty, no duplicates, one chart.
     * @param event_id Event the seats are held for.
     * @param session_id Owning checkout session; non-empty.
     * @param duration_minutes Hold duration; 0 selects the configured default.
     *        Values above EngineConfig::max_hold_minutes are rejected.
     * @param customer_email Optional customer identifier.
     * @return HoldResult with the created batch, or kSeatUnavailable listing the
     *         seats that blocked the batch. Other errors: kInvalidRequest,
     *         kSeatNotFound.
     *
     * @details
     * - Seats are validated against the catalog (existence, chart, effective availability).
     * - All seats are pre-checked against the store so every blocker is reported at once.
     * - Seats are then acquired one by one, in sorted order, with the store's
     *   conditional insert. Stale holds on a seat are expired in the same step.
     * - kTransient answers from the store are retried with exponential backoff
     *   (config.retry_attempts, config.retry_base_delay_ms) and count as a
     *   conflict once exhausted.
     */
    HoldResult hold_seats(const std::vector<SeatId>& seat_ids,
                          const EventId& event_id,
                          const SessionId& session_id,
                          int duration_minutes = 0,
                          const std::string& customer_email = "");

    /**
     * @brief Pushes the expiry of an active hold forward.
     *
     * Only an `active`, unexpired hold can be extended; it becomes `extended`.
     * @return kHoldNotFound, kHoldExpired, kHoldNotActive or kInvalidRequest
     *         (non-positive minutes, or more than max_hold_minutes) on failure.
     */
    ExtendResult extend_hold(const HoldId& hold_id, int additional_minutes);

    /**
     * @brief Cancels every live hold matching all set fields of @p filter.
     *
     * Idempotent: closed or lapsed holds are skipped and not counted.
     * An empty filter is rejected with kInvalidRequest.
     */
    ReleaseResult release_holds(const HoldFilter& filter);

    /** @brief Every hold of a session at an event, ordered by (held_at, seat id). */
    std::vector<HoldStatusView> hold_status(const SessionId& session_id, const EventId& event_id) const;

    /** @brief Fresh checkout session id. */
    std::string new_session_id();

    const EngineConfig& config() const { return config_; }

private:
    const SeatCatalog& catalog_;
    SeatStore& store_;
    const Clock& clock_;
    EngineConfig config_;
    IdGenerator ids_;

    /**
     * @brief Validates the request against the catalog.
     *
     * @param seat_ids Sorted, de-duplicated request.
     * @param out_blocked Filled with seats that are not sellable for the event.
     * @return kNone if the request may proceed to the store.
     */
    ErrorCode validate_seats_or_fail(const std::vector<SeatId>& seat_ids,
                                     const EventId& event_id,
                                     std::string& out_error,
                                     std::vector<SeatId>& out_blocked) const;

    /** @brief One conditional insert with bounded retry on transient contention. */
    AcquireResult acquire_with_retry(const HoldRequest& req);
};

} // namespace seating
