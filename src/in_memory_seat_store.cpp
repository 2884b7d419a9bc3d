#include "in_memory_seat_store.hpp"

#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

namespace seating {

HoldId InMemorySeatStore::next_hold_id_locked() {
    std::ostringstream oss;
    oss << "hold-" << std::setw(8) << std::setfill('0') << next_hold_++;
    return oss.str();
}

void InMemorySeatStore::close_hold_locked(SeatHold& hold, HoldStatus status) {
    auto it = open_by_seat_.find(SeatKey(hold.event_id, hold.seat_id));
    if (it != open_by_seat_.end() && it->second == hold.id) {
        open_by_seat_.erase(it);
    }
    hold.status = status;
}

const SeatHold* InMemorySeatStore::live_hold_locked(const SeatKey& key, Timestamp now) const {
    auto it = open_by_seat_.find(key);
    if (it == open_by_seat_.end()) return nullptr;
    auto h = holds_.find(it->second);
    if (h == holds_.end() || !is_live(h->second, now)) return nullptr;
    return &h->second;
}

AcquireResult InMemorySeatStore::try_acquire_hold(const HoldRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SeatKey key(req.event_id, req.seat_id);

    if (sold_.count(key) != 0) {
        return AcquireResult{AcquireResult::Status::kConflict, SeatHold{}};
    }

    auto open = open_by_seat_.find(key);
    if (open != open_by_seat_.end()) {
        SeatHold& existing = holds_.at(open->second);
        if (existing.expires_at > req.now) {
            return AcquireResult{AcquireResult::Status::kConflict, SeatHold{}};
        }
        // Lazy expiry: the stale hold gives way before the new one is granted.
        spdlog::debug("Lazily expiring hold {} on seat {} for event {}",
                      existing.id, existing.seat_id, existing.event_id);
        close_hold_locked(existing, HoldStatus::kExpired);
    }

    SeatHold hold;
    hold.id = next_hold_id_locked();
    hold.batch_id = req.batch_id;
    hold.seat_id = req.seat_id;
    hold.event_id = req.event_id;
    hold.session_id = req.session_id;
    hold.customer_email = req.customer_email;
    hold.held_at = req.now;
    hold.expires_at = req.expires_at;
    hold.duration_minutes = req.duration_minutes;
    hold.status = HoldStatus::kActive;

    open_by_seat_.emplace(key, hold.id);
    by_session_[SessionKey(hold.session_id, hold.event_id)].push_back(hold.id);
    holds_.emplace(hold.id, hold);
    return AcquireResult{AcquireResult::Status::kAcquired, hold};
}

SeatState InMemorySeatStore::seat_state(const EventId& event_id, const SeatId& seat_id, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const SeatKey key(event_id, seat_id);
    if (sold_.count(key) != 0) return SeatState::kSold;
    if (live_hold_locked(key, now)) return SeatState::kHeld;
    return SeatState::kAvailable;
}

std::map<SeatId, SeatState> InMemorySeatStore::query_seat_states(const EventId& event_id,
                                                                 const std::vector<SeatId>& seat_ids,
                                                                 Timestamp now) const {
    std::map<SeatId, SeatState> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& seat_id : seat_ids) {
        const SeatKey key(event_id, seat_id);
        if (sold_.count(key) != 0) {
            out[seat_id] = SeatState::kSold;
        } else if (live_hold_locked(key, now)) {
            out[seat_id] = SeatState::kHeld;
        }
    }
    return out;
}

std::size_t InMemorySeatStore::release_holds(const HoldFilter& filter, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto matches = [&](const SeatHold& h) {
        if (filter.session_id && h.session_id != *filter.session_id) return false;
        if (filter.event_id && h.event_id != *filter.event_id) return false;
        return true;
    };

    // Candidate ids come from the narrowest index the filter allows.
    std::set<HoldId> candidates;
    if (filter.hold_ids) {
        candidates.insert(filter.hold_ids->begin(), filter.hold_ids->end());
    } else if (filter.session_id && filter.event_id) {
        auto it = by_session_.find(SessionKey(*filter.session_id, *filter.event_id));
        if (it != by_session_.end()) candidates.insert(it->second.begin(), it->second.end());
    } else if (filter.session_id) {
        for (auto it = by_session_.lower_bound(SessionKey(*filter.session_id, EventId()));
             it != by_session_.end() && it->first.first == *filter.session_id; ++it) {
            candidates.insert(it->second.begin(), it->second.end());
        }
    } else if (filter.event_id) {
        // Only open holds can be released.
        for (auto it = open_by_seat_.lower_bound(SeatKey(*filter.event_id, SeatId()));
             it != open_by_seat_.end() && it->first.first == *filter.event_id; ++it) {
            candidates.insert(it->second);
        }
    }

    std::vector<SeatHold*> targets;
    for (const auto& id : candidates) {
        auto it = holds_.find(id);
        if (it != holds_.end() && matches(it->second)) targets.push_back(&it->second);
    }

    std::size_t released = 0;
    for (SeatHold* h : targets) {
        if (!is_open_status(h->status)) continue;
        if (h->expires_at <= now) {
            close_hold_locked(*h, HoldStatus::kExpired);
            continue;
        }
        close_hold_locked(*h, HoldStatus::kCancelled);
        ++released;
    }
    return released;
}

ExtendOutcome InMemorySeatStore::extend_hold(const HoldId& hold_id,
                                             std::chrono::minutes additional,
                                             Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holds_.find(hold_id);
    if (it == holds_.end()) return ExtendOutcome::kNotFound;

    SeatHold& h = it->second;
    if (h.status == HoldStatus::kExpired) return ExtendOutcome::kExpired;
    if (is_open_status(h.status) && h.expires_at <= now) {
        close_hold_locked(h, HoldStatus::kExpired);
        return ExtendOutcome::kExpired;
    }
    if (h.status != HoldStatus::kActive) return ExtendOutcome::kNotActive;

    h.status = HoldStatus::kExtended;
    h.expires_at += additional;
    return ExtendOutcome::kExtended;
}

std::vector<HoldId> InMemorySeatStore::find_lapsed_holds(Timestamp now) const {
    std::vector<HoldId> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : open_by_seat_) {
        const SeatHold& h = holds_.at(kv.second);
        if (h.expires_at <= now) out.push_back(h.id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::size_t InMemorySeatStore::mark_expired(const std::vector<HoldId>& hold_ids, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& id : hold_ids) {
        auto it = holds_.find(id);
        if (it == holds_.end()) continue;
        SeatHold& h = it->second;
        if (!is_open_status(h.status) || h.expires_at > now) continue;
        close_hold_locked(h, HoldStatus::kExpired);
        ++count;
    }
    return count;
}

CommitResult InMemorySeatStore::commit_sale(const SaleRequest& req) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate every hold before writing anything.
    std::vector<SeatHold*> holds;
    std::vector<SeatId> failed;
    std::vector<HoldId> missing;
    std::set<HoldId> seen;
    for (const auto& id : req.hold_ids) {
        if (!seen.insert(id).second) continue;
        auto it = holds_.find(id);
        if (it == holds_.end()) {
            missing.push_back(id);
            continue;
        }
        SeatHold& h = it->second;
        const bool owned = h.session_id == req.session_id && h.event_id == req.event_id;
        const bool sold = sold_.count(SeatKey(h.event_id, h.seat_id)) != 0;
        if (!owned || sold || !is_live(h, req.now)) {
            failed.push_back(h.seat_id);
            continue;
        }
        holds.push_back(&h);
    }

    if (!failed.empty() || !missing.empty()) {
        std::sort(failed.begin(), failed.end());
        std::sort(missing.begin(), missing.end());
        return CommitResult{false, {}, failed, missing};
    }

    std::vector<SeatId> sold_ids;
    for (SeatHold* h : holds) {
        SoldSeat rec{h->seat_id, h->event_id, req.order_id, req.session_id, req.now};
        sold_.emplace(SeatKey(h->event_id, h->seat_id), rec);
        close_hold_locked(*h, HoldStatus::kCompleted);
        sold_ids.push_back(h->seat_id);
    }
    std::sort(sold_ids.begin(), sold_ids.end());
    return CommitResult{true, sold_ids, {}, {}};
}

std::optional<SeatHold> InMemorySeatStore::find_hold(const HoldId& hold_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holds_.find(hold_id);
    if (it == holds_.end()) return std::nullopt;
    return it->second;
}

std::vector<SeatHold> InMemorySeatStore::holds_for_session(const SessionId& session_id,
                                                           const EventId& event_id) const {
    std::vector<SeatHold> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_session_.find(SessionKey(session_id, event_id));
        if (it == by_session_.end()) return out;
        out.reserve(it->second.size());
        for (const auto& id : it->second) {
            out.push_back(holds_.at(id));
        }
    }
    std::sort(out.begin(), out.end(), [](const SeatHold& a, const SeatHold& b) { return a.id < b.id; });
    return out;
}

std::vector<SoldSeat> InMemorySeatStore::sold_seats(const EventId& event_id) const {
    std::vector<SoldSeat> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : sold_) {
        if (kv.first.first == event_id) out.push_back(kv.second);
    }
    return out;
}

std::vector<SeatHold> InMemorySeatStore::all_holds() const {
    std::vector<SeatHold> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(holds_.size());
        for (const auto& kv : holds_) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const SeatHold& a, const SeatHold& b) { return a.id < b.id; });
    return out;
}

} // namespace seating
