#include "seat_types.hpp"

#include <string>

namespace seating {

bool is_open_status(HoldStatus status) {
    return status == HoldStatus::kActive || status == HoldStatus::kExtended;
}

bool is_live(const SeatHold& hold, Timestamp now) {
    return is_open_status(hold.status) && hold.expires_at > now;
}

bool is_lapsed(const SeatHold& hold, Timestamp now) {
    if (hold.status == HoldStatus::kExpired) return true;
    return is_open_status(hold.status) && hold.expires_at <= now;
}

const char* to_string(HoldStatus status) {
    switch (status) {
        case HoldStatus::kActive:    return "active";
        case HoldStatus::kExtended:  return "extended";
        case HoldStatus::kCompleted: return "completed";
        case HoldStatus::kExpired:   return "expired";
        case HoldStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(SeatState state) {
    switch (state) {
        case SeatState::kAvailable: return "available";
        case SeatState::kHeld:      return "held";
        case SeatState::kSold:      return "sold";
        case SeatState::kInactive:  return "inactive";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::kNone:                     return "none";
        case ErrorCode::kInvalidRequest:           return "invalid_request";
        case ErrorCode::kChartNotFound:            return "chart_not_found";
        case ErrorCode::kSeatNotFound:             return "seat_not_found";
        case ErrorCode::kSeatUnavailable:          return "seat_unavailable";
        case ErrorCode::kHoldNotFound:             return "hold_not_found";
        case ErrorCode::kHoldExpired:              return "hold_expired";
        case ErrorCode::kHoldNotActive:            return "hold_not_active";
        case ErrorCode::kInsufficientAvailability: return "insufficient_availability";
        case ErrorCode::kPartialExpiry:            return "partial_expiry";
        case ErrorCode::kStorageConflict:          return "storage_conflict";
    }
    return "unknown";
}

std::string format_cents(Cents amount) {
    const bool negative = amount < 0;
    const Cents abs_amount = negative ? -amount : amount;
    const Cents cents = abs_amount % 100;
    std::string out = (negative ? "-" : "") + std::to_string(abs_amount / 100) + ".";
    if (cents < 10) out += "0";
    out += std::to_string(cents);
    return out;
}

} // namespace seating
