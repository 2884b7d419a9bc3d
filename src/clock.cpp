#include "clock.hpp"

namespace seating {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(Timestamp start) : now_(start) {}

Timestamp ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = t;
}

Timestamp ManualClock::default_start() {
    // 1767225600 = 2026-01-01T00:00:00Z
    return Timestamp(std::chrono::seconds(1767225600));
}

} // namespace seating
