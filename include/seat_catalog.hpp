#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "seat_types.hpp"

/**
 * @file seat_catalog.hpp
 * @brief Read-mostly catalog of charts, categories and seats plus event overrides.
 *
 * Storage is arena-style: seats and categories live in their own vectors and
 * are looked up through id -> index maps. Seats refer to categories by id.
 *
 * The catalog is populated once (by the chart loader or by tests) and then
 * only read. It is not synchronized for concurrent mutation; concurrent
 * readers are safe once loading has finished.
 */

namespace seating {

/**
 * @brief Result of a catalog authoring call.
 */
struct CatalogResult {
    bool success;         /**< True if the record was added. */
    std::string message;  /**< Reason for failure (empty on success). */
};

/**
 * @brief Minimum and maximum seat numbers of a section.
 */
struct SectionBounds {
    int min_number = 0;
    int max_number = 0;
};

/**
 * @brief Arena-backed seat catalog.
 */
class SeatCatalog {
public:
    SeatCatalog() = default;

    // ---- authoring (loader / tests) ----

    /** @brief Adds a chart. Fails on an empty or duplicate id. */
    CatalogResult add_chart(const SeatingChart& chart);

    /**
     * @brief Adds a category to an existing chart.
     *
     * Fails on duplicate id, unknown chart, duplicate name inside the chart, or
     * a non-positive price modifier.
     */
    CatalogResult add_category(const SeatCategory& category);

    /**
     * @brief Adds a seat to an existing chart.
     *
     * The category (when given) must exist and belong to the same chart.
     */
    CatalogResult add_seat(const Seat& seat);

    /**
     * @brief Installs or replaces the overrides of an event.
     *
     * Binds the event to @p overrides.chart_id. Overrides may only reference
     * seats and categories of that chart; multipliers must be positive.
     */
    CatalogResult set_overrides(const EventOverrides& overrides);

    // ---- lookups ----

    /** @brief All charts in insertion order. */
    std::vector<const SeatingChart*> charts() const;

    /** @brief Returns the chart or nullptr (chart not found). */
    const SeatingChart* find_chart(const ChartId& chart_id) const;

    /** @brief Returns the seat or nullptr (seat not found). */
    const Seat* find_seat(const SeatId& seat_id) const;

    /** @brief Returns the category or nullptr. */
    const SeatCategory* find_category(const CategoryId& category_id) const;

    /** @brief Returns the overrides of an event or nullptr if it has none. */
    const EventOverrides* find_overrides(const EventId& event_id) const;

    /** @brief Returns the chart an event is bound to, or an empty id. */
    ChartId chart_for_event(const EventId& event_id) const;

    /**
     * @brief Seats of a chart ordered by (section, row, number, id).
     * @return Empty if the chart does not exist or has no seats.
     */
    std::vector<const Seat*> seats_in_chart(const ChartId& chart_id) const;

    /** @brief Categories of a chart ordered by (sort_order, name). */
    std::vector<const SeatCategory*> categories_in_chart(const ChartId& chart_id) const;

    /**
     * @brief Seat number range of a section over all seats of the chart.
     *
     * Inactive seats are included: the section's physical centre does not move
     * when a seat is taken out of sale.
     */
    SectionBounds section_bounds(const ChartId& chart_id, const std::string& section) const;

    std::size_t seat_count() const { return seats_.size(); }
    std::size_t category_count() const { return categories_.size(); }

    // ---- pure override merge ----

    /**
     * @brief Computes the price of a seat for an event.
     *
     * @param seat The seat.
     * @param category The seat's category, or nullptr.
     * @param overrides The event overrides, or nullptr.
     * @return Seat price override if present; otherwise base x multiplier, where
     *         base is the seat base price (or the category base price) and the
     *         multiplier is the event's category override, else the category's
     *         own modifier, else 1.0. Rounded to whole cents.
     */
    static Cents effective_price(const Seat& seat,
                                 const SeatCategory* category,
                                 const EventOverrides* overrides);

    /**
     * @brief Computes whether a seat may be sold for an event.
     * @return seat.active && (availability override, defaulting to true).
     */
    static bool effective_availability(const Seat& seat, const EventOverrides* overrides);

    /** @brief Convenience: effective price of @p seat under @p event_id's overrides. */
    Cents price_for_event(const Seat& seat, const EventId& event_id) const;

    /** @brief Convenience: effective availability of @p seat under @p event_id's overrides. */
    bool available_for_event(const Seat& seat, const EventId& event_id) const;

private:
    std::vector<SeatingChart> charts_;
    std::vector<SeatCategory> categories_;
    std::vector<Seat> seats_;
    std::vector<EventOverrides> overrides_;

    std::unordered_map<ChartId, std::size_t> chart_index_;
    std::unordered_map<CategoryId, std::size_t> category_index_;
    std::unordered_map<SeatId, std::size_t> seat_index_;
    std::unordered_map<EventId, std::size_t> overrides_index_;

    // chart id -> indices into seats_ / categories_
    std::unordered_map<ChartId, std::vector<std::size_t>> chart_seats_;
    std::unordered_map<ChartId, std::vector<std::size_t>> chart_categories_;
};

} // namespace seating
