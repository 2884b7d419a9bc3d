#include "expiry_sweeper.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace seating {

ExpirySweeper::ExpirySweeper(SeatStore& store, const Clock& clock, std::chrono::milliseconds interval)
    : store_(store), clock_(clock), interval_(interval) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

std::size_t ExpirySweeper::sweep_once() {
    const Timestamp now = clock_.now();
    const std::vector<HoldId> lapsed = store_.find_lapsed_holds(now);
    std::size_t expired = 0;
    if (!lapsed.empty()) {
        // Conditional: holds completed or extended since the scan are skipped.
        expired = store_.mark_expired(lapsed, now);
    }
    total_expired_.fetch_add(expired);
    sweep_count_.fetch_add(1);
    if (expired > 0) {
        spdlog::info("Expiry sweep reclaimed {} holds", expired);
    }
    return expired;
}

void ExpirySweeper::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::make_unique<std::thread>([this] { run_loop(); });
    spdlog::debug("Expiry sweeper started, interval {} ms", interval_.count());
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_ && worker_->joinable()) {
        worker_->join();
        spdlog::debug("Expiry sweeper stopped after {} sweeps", sweep_count_.load());
    }
    worker_.reset();
    running_.store(false);
}

void ExpirySweeper::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            sweep_once();
        } catch (const std::exception& e) {
            spdlog::error("Expiry sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace seating
