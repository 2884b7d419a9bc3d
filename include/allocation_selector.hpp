#pragma once

#include <optional>
#include <string>
#include <vector>

#include "availability_view.hpp"
#include "seat_catalog.hpp"

/**
 * @file allocation_selector.hpp
 * @brief Deterministic "best available" seat proposal.
 *
 * Selection policy:
 * 1. Candidates are seats in state `available` whose effective price is within
 *    max_price and whose section matches section_preference (when given).
 * 2. prefer_together: every run of exactly `quantity` consecutive seat numbers
 *    in one (section, row) is scored by
 *    - lowest total price, then
 *    - smallest average distance from the section centre
 *      (centre = midpoint of the section's catalog seat numbers), then
 *    - lowest seat ids.
 * 3. Fallback when no run exists (or prefer_together is false): the `quantity`
 *    cheapest candidates, ties broken by lowest seat id.
 *
 * The selector never mutates anything. Its proposal is passed to
 * HoldManager::hold_seats(), which may still lose a race for it.
 */

namespace seating {

/**
 * @brief Parameters of a best-available query.
 */
struct SelectionRequest {
    EventId event_id;
    ChartId chart_id;
    int quantity = 1;
    bool prefer_together = true;
    std::optional<Cents> max_price;
    std::optional<std::string> section_preference;
};

/**
 * @brief Proposed seats.
 */
struct SelectionResult {
    bool success;
    ErrorCode error;
    std::string message;
    std::vector<SeatView> seats;  /**< Contiguous runs in seat-number order; fallback in (price, id) order. */
    bool contiguous;              /**< True if the run policy produced the set (always for a single seat). */
    std::size_t available;        /**< Number of eligible candidates (reported on kInsufficientAvailability). */
    Cents total_price;
};

class AllocationSelector {
public:
    AllocationSelector(const SeatCatalog& catalog, const AvailabilityView& view);

    /**
     * @brief Proposes @p req.quantity seats.
     *
     * @return kInvalidRequest for a non-positive quantity or a chart other than
     *         the one the event is bound to, kChartNotFound, or
     *         kInsufficientAvailability with SelectionResult::available set.
     */
    SelectionResult get_best_available_seats(const SelectionRequest& req) const;

private:
    const SeatCatalog& catalog_;
    const AvailabilityView& view_;

    /**
     * @brief Best contiguous run, or an empty vector if none exists.
     *
     * @param candidates Eligible seats.
     */
    std::vector<SeatView> best_contiguous_run(const ChartId& chart_id,
                                              const std::vector<SeatView>& candidates,
                                              int quantity) const;

    static std::vector<SeatView> cheapest_seats(std::vector<SeatView> candidates, int quantity);
};

} // namespace seating
