#pragma once

#include <string>

#include "engine_config.hpp"
#include "seat_catalog.hpp"

/**
 * @file chart_loader.hpp
 * @brief Builds a SeatCatalog from a YAML chart definition.
 *
 * Document layout (prices are decimal currency units, stored as cents):
 * @code
 * charts:
 *   - {id: main, venue_id: hall, name: Main Hall}
 * categories:
 *   - {id: orch, chart_id: main, name: Orchestra, color: "#1E40AF",
 *      base_price: 50.00, price_modifier: 1.0, sort_order: 0}
 * seats:
 *   - {id: VIP1, chart_id: main, section: Box, row: V, number: 1,
 *      category_id: orch, base_price: 120.00, premium: true}
 * rows:                       # shorthand for runs of seats
 *   - {chart_id: main, section: Orchestra, row: A, first: 1, last: 12,
 *      category_id: orch}     # ids "A1".."A12" (id_prefix defaults to row)
 * events:
 *   - id: concert-1
 *     chart_id: main
 *     seat_prices: {A1: 80.00}
 *     category_multipliers: {orch: 1.25}
 *     seat_availability: {A2: false}
 * @endcode
 */

namespace seating {

/**
 * @brief Parses a chart file into @p out.
 *
 * @p out is replaced only if the whole document loads; otherwise it is left
 * untouched and the first error is returned.
 */
LoadResult load_chart_file(const std::string& path, SeatCatalog& out);

/** @brief Same as load_chart_file() for an in-memory document. */
LoadResult load_chart_string(const std::string& yaml, SeatCatalog& out);

/** @brief Converts a decimal currency amount to cents, rounding half away from zero. */
Cents to_cents(double amount);

} // namespace seating
