#pragma once

#include <optional>
#include <string>
#include <vector>

#include "clock.hpp"
#include "seat_catalog.hpp"
#include "seat_store.hpp"

/**
 * @file availability_view.hpp
 * @brief Computed read model of per-seat status for one event.
 *
 * The view merges catalog data with the live holds and sold records of the
 * store. It never drives a mutation: HoldManager re-checks every seat against
 * the store at acquisition time, so a stale view can only cost a retry, never
 * an oversell.
 */

namespace seating {

/**
 * @brief A seat as presented to a buyer for one event.
 */
struct SeatView {
    SeatId seat_id;
    std::string section;
    std::string row;
    int number = 0;
    std::optional<double> x;
    std::optional<double> y;
    CategoryId category_id;
    std::string category_name;
    std::string category_color;
    Cents price = 0;          /**< Effective price after event overrides. */
    bool accessible = false;
    bool premium = false;
    SeatState state = SeatState::kAvailable;
};

/**
 * @brief Result of a view query.
 */
struct ViewResult {
    bool success;
    ErrorCode error;
    std::string message;
    std::vector<SeatView> seats;  /**< Ordered by (section, row, number, id). */
};

/**
 * @brief Seat counts of a chart for one event.
 */
struct AvailabilitySummary {
    bool success = false;
    ErrorCode error = ErrorCode::kNone;
    std::string message;
    std::size_t total = 0;
    std::size_t available = 0;
    std::size_t held = 0;
    std::size_t sold = 0;
    std::size_t inactive = 0;
    Cents sold_revenue = 0;   /**< Sum of effective prices of sold seats. */
};

class AvailabilityView {
public:
    AvailabilityView(const SeatCatalog& catalog, const SeatStore& store, const Clock& clock);

    /**
     * @brief Every seat of @p chart_id with its state for @p event_id.
     *
     * State precedence: sold, then held (live hold), then inactive, then available.
     * Fails with kChartNotFound for an unknown chart.
     */
    ViewResult get_available_seats(const EventId& event_id, const ChartId& chart_id) const;

    /** @brief Aggregated counts over get_available_seats(). */
    AvailabilitySummary summarize(const EventId& event_id, const ChartId& chart_id) const;

private:
    const SeatCatalog& catalog_;
    const SeatStore& store_;
    const Clock& clock_;
};

} // namespace seating
