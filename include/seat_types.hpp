#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file seat_types.hpp
 * @brief Core domain types shared by every component of the seating engine.
 *
 * This header defines:
 * - Identifier aliases (seat, chart, category, event, session, hold, order)
 * - Catalog records: SeatingChart, SeatCategory, Seat, EventOverrides
 * - Hold lifecycle records: SeatHold, SoldSeat
 * - Error codes shared by all result types
 *
 * Seats reference categories by id only. The catalog keeps seats and categories
 * in separate arenas, so no record ever holds a pointer to another record.
 */

namespace seating {

using SeatId = std::string;
using ChartId = std::string;
using CategoryId = std::string;
using VenueId = std::string;
using EventId = std::string;
using SessionId = std::string;
using HoldId = std::string;
using BatchId = std::string;
using OrderId = std::string;

/**
 * @brief Monetary amount in whole cents.
 *
 * Integer cents keep totals exact, which matters for deterministic tie-breaking
 * in seat selection.
 */
using Cents = std::int64_t;

/** @brief Wall-clock instant used for hold timestamps. */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A seating chart (layout template) for a venue.
 */
struct SeatingChart {
    ChartId id;          /**< Unique chart identifier. */
    VenueId venue_id;    /**< Venue the chart belongs to. */
    std::string name;    /**< Human-readable chart name. */
    int version = 1;     /**< Authoring version of the layout. */
    bool active = true;  /**< Inactive charts are kept for history only. */
};

/**
 * @brief A pricing/display category owned by a chart.
 */
struct SeatCategory {
    CategoryId id;              /**< Unique category identifier. */
    ChartId chart_id;           /**< Owning chart. */
    std::string name;           /**< Display name, e.g. "Orchestra". */
    std::string color;          /**< Display color code, e.g. "#3B82F6". */
    Cents base_price = 0;       /**< Price used by seats that carry none. */
    double price_modifier = 1.0;/**< Template multiplier applied to seat base prices. */
    bool accessible = false;    /**< Category is accessible seating. */
    bool premium = false;       /**< Category is premium seating. */
    int sort_order = 0;         /**< Display ordering inside the chart. */
};

/**
 * @brief A single physical seat in a chart.
 *
 * Seats are never deleted once a hold or sale references them; they are
 * deactivated instead.
 */
struct Seat {
    SeatId id;                    /**< Unique seat identifier. */
    ChartId chart_id;             /**< Owning chart. */
    std::string section;          /**< Section label, e.g. "Orchestra". */
    std::string row;              /**< Row label, e.g. "A". */
    int number = 0;               /**< Seat number inside the row. */
    std::optional<double> x;      /**< Optional layout x position. */
    std::optional<double> y;      /**< Optional layout y position. */
    CategoryId category_id;       /**< Category reference (may be empty). */
    std::optional<Cents> base_price; /**< Seat base price; falls back to the category price. */
    bool accessible = false;      /**< Accessible seat. */
    bool premium = false;         /**< Premium seat. */
    bool active = true;           /**< False once the seat has been deactivated. */
};

/**
 * @brief Event-specific adjustments layered over a shared chart template.
 *
 * Overrides are applied at read time; the template is never modified.
 */
struct EventOverrides {
    EventId event_id;                                 /**< Event the overrides apply to. */
    ChartId chart_id;                                 /**< Chart the event is seated on. */
    std::map<SeatId, Cents> seat_prices;              /**< Absolute per-seat price overrides. */
    std::map<CategoryId, double> category_multipliers;/**< Per-category price multipliers. */
    std::map<SeatId, bool> seat_availability;         /**< Per-seat availability overrides. */
};

/**
 * @brief Lifecycle state of a hold.
 */
enum class HoldStatus {
    kActive,
    kExtended,
    kCompleted,
    kExpired,
    kCancelled
};

/**
 * @brief Effective state of a seat for one event.
 */
enum class SeatState {
    kAvailable,
    kHeld,
    kSold,
    kInactive  /**< Deactivated seat or availability override set to false. */
};

/**
 * @brief A time-bounded exclusivity claim on a seat.
 *
 * A hold owns the temporary exclusivity, never the seat itself.
 */
struct SeatHold {
    HoldId id;                     /**< Unique hold identifier. */
    BatchId batch_id;              /**< Identifier shared by all holds of one hold_seats call. */
    SeatId seat_id;                /**< Held seat. */
    EventId event_id;              /**< Event the seat is held for. */
    SessionId session_id;          /**< Checkout session that owns the hold. */
    std::string customer_email;    /**< Optional customer identifier (may be empty). */
    Timestamp held_at;             /**< Creation time. */
    Timestamp expires_at;          /**< Time after which the hold no longer protects the seat. */
    int duration_minutes = 0;      /**< Requested duration at creation. */
    HoldStatus status = HoldStatus::kActive;
    std::string reason = "checkout"; /**< Why the seat is held. */
};

/**
 * @brief Boundary record written once per sold seat.
 */
struct SoldSeat {
    SeatId seat_id;
    EventId event_id;
    OrderId order_id;
    SessionId session_id;
    Timestamp finalized_at;
};

/**
 * @brief Error codes shared by every result type of the engine.
 */
enum class ErrorCode {
    kNone,
    kInvalidRequest,
    kChartNotFound,
    kSeatNotFound,
    kSeatUnavailable,          /**< Lost a race or seat not sellable; pick different seats. */
    kHoldNotFound,
    kHoldExpired,              /**< Benign; re-allocate. */
    kHoldNotActive,            /**< Hold exists but is extended, completed or cancelled. */
    kInsufficientAvailability, /**< Fewer eligible seats than requested. */
    kPartialExpiry,            /**< Some session holds lapsed before finalize; re-hold them. */
    kStorageConflict           /**< Transient store contention. */
};

/** @brief True for statuses that still grant exclusivity (before time is checked). */
bool is_open_status(HoldStatus status);

/** @brief True if the hold still protects its seat at @p now. */
bool is_live(const SeatHold& hold, Timestamp now);

/** @brief True if the hold has expired by time or has already been marked expired. */
bool is_lapsed(const SeatHold& hold, Timestamp now);

const char* to_string(HoldStatus status);
const char* to_string(SeatState state);
const char* to_string(ErrorCode code);

/** @brief Formats cents as "12.34". */
std::string format_cents(Cents amount);

} // namespace seating
