#pragma once

#include <mutex>

#include "seat_types.hpp"

/**
 * @file clock.hpp
 * @brief Injectable time source.
 *
 * Every component that compares against "now" receives a Clock by reference,
 * so tests can move time forward deterministically instead of sleeping.
 */

namespace seating {

/**
 * @brief Abstract time source.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /** @brief Returns the current instant. */
    virtual Timestamp now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock.
 */
class SystemClock : public Clock {
public:
    Timestamp now() const override;
};

/**
 * @brief Manually driven clock for tests and simulations.
 *
 * Thread-safe: readers and the thread advancing time may run concurrently.
 */
class ManualClock : public Clock {
public:
    /** @brief Starts at @p start (defaults to a fixed, reproducible instant). */
    explicit ManualClock(Timestamp start = default_start());

    Timestamp now() const override;

    /** @brief Moves time forward by @p delta. */
    void advance(std::chrono::milliseconds delta);

    /** @brief Jumps to an absolute instant. */
    void set(Timestamp t);

    /** @brief 2026-01-01T00:00:00Z. */
    static Timestamp default_start();

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

} // namespace seating
