#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "seat_store.hpp"

/**
 * @file in_memory_seat_store.hpp
 * @brief In-process implementation of the SeatStore port.
 *
 * Concurrency model:
 * - One mutex guards all tables; each port call is a single critical section,
 *   the in-process equivalent of one conditional write against a database.
 * - No call ever waits on another caller for longer than that critical section.
 *
 * Tables:
 * - holds_        : every hold ever created, keyed by hold id
 * - open_by_seat_ : (event, seat) -> id of the open (active/extended) hold
 * - by_session_   : (session, event) -> ids of every hold of that session
 * - sold_         : (event, seat) -> sold record
 *
 * open_by_seat_ enforces "at most one open hold per (event, seat)".
 * Filtered reads and releases go through the two indexes and never scan the
 * full hold history.
 */

namespace seating {

class InMemorySeatStore : public SeatStore {
public:
    InMemorySeatStore() = default;

    InMemorySeatStore(const InMemorySeatStore&) = delete;
    InMemorySeatStore& operator=(const InMemorySeatStore&) = delete;

    AcquireResult try_acquire_hold(const HoldRequest& req) override;

    SeatState seat_state(const EventId& event_id, const SeatId& seat_id, Timestamp now) const override;

    std::map<SeatId, SeatState> query_seat_states(const EventId& event_id,
                                                  const std::vector<SeatId>& seat_ids,
                                                  Timestamp now) const override;

    std::size_t release_holds(const HoldFilter& filter, Timestamp now) override;

    ExtendOutcome extend_hold(const HoldId& hold_id,
                              std::chrono::minutes additional,
                              Timestamp now) override;

    std::vector<HoldId> find_lapsed_holds(Timestamp now) const override;

    std::size_t mark_expired(const std::vector<HoldId>& hold_ids, Timestamp now) override;

    CommitResult commit_sale(const SaleRequest& req) override;

    std::optional<SeatHold> find_hold(const HoldId& hold_id) const override;

    std::vector<SeatHold> holds_for_session(const SessionId& session_id,
                                            const EventId& event_id) const override;

    std::vector<SoldSeat> sold_seats(const EventId& event_id) const override;

    /** @brief Snapshot of every hold, ordered by hold id. Used by tests and the CLI. */
    std::vector<SeatHold> all_holds() const;

private:
    using SeatKey = std::pair<EventId, SeatId>;
    using SessionKey = std::pair<SessionId, EventId>;

    mutable std::mutex mutex_;
    std::unordered_map<HoldId, SeatHold> holds_;
    std::map<SeatKey, HoldId> open_by_seat_;
    std::map<SessionKey, std::vector<HoldId>> by_session_;
    std::map<SeatKey, SoldSeat> sold_;
    std::uint64_t next_hold_ = 1;

    /** @brief Generates the next hold id. Caller must hold mutex_. */
    HoldId next_hold_id_locked();

    /**
     * @brief Moves an open hold to @p status and drops it from the open index.
     * Caller must hold mutex_.
     */
    void close_hold_locked(SeatHold& hold, HoldStatus status);

    /** @brief Open hold on a seat that is still live at @p now, or nullptr. Caller must hold mutex_. */
    const SeatHold* live_hold_locked(const SeatKey& key, Timestamp now) const;
};

} // namespace seating
