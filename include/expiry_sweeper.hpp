#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "clock.hpp"
#include "seat_store.hpp"

/**
 * @file expiry_sweeper.hpp
 * @brief Periodic reclamation of lapsed holds.
 *
 * The sweeper only keeps the read model accurate when no further writes touch
 * a seat. Oversell protection never depends on it: the store expires stale
 * holds lazily whenever a seat is acquired, extended or sold.
 */

namespace seating {

class ExpirySweeper {
public:
    /**
     * @param store Store to sweep; must outlive the sweeper.
     * @param clock Time source used to decide what has lapsed.
     * @param interval Wall-clock period between sweeps of the background thread.
     */
    ExpirySweeper(SeatStore& store, const Clock& clock,
                  std::chrono::milliseconds interval = std::chrono::seconds(60));

    /** @brief Stops the background thread if it is running. */
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /**
     * @brief Marks every lapsed active/extended hold as expired.
     * @return Number of holds transitioned by this sweep.
     */
    std::size_t sweep_once();

    /** @brief Starts the background thread. No-op if already running. */
    void start();

    /** @brief Wakes and joins the background thread. Safe to call twice. */
    void stop();

    bool running() const { return running_.load(); }

    /** @brief Holds expired by all sweeps so far. */
    std::size_t total_expired() const { return total_expired_.load(); }

    /** @brief Completed sweeps so far (manual and background). */
    std::size_t sweep_count() const { return sweep_count_.load(); }

private:
    SeatStore& store_;
    const Clock& clock_;
    std::chrono::milliseconds interval_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;  // guarded by mutex_
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> total_expired_{0};
    std::atomic<std::size_t> sweep_count_{0};
    std::unique_ptr<std::thread> worker_;

    void run_loop();
};

} // namespace seating
