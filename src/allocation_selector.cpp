#include "allocation_selector.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>

namespace seating {

namespace {

/**
 * @brief Ranking key of a contiguous run; smaller is better.
 *
 * centrality is the sum of |2 * number - (min + max)| over the run, i.e. twice
 * the summed distance from the section centre. Every run has the same length,
 * so comparing sums compares averages, and integers keep the order exact.
 */
struct RunScore {
    Cents total = 0;
    long long centrality = 0;
    std::vector<SeatId> ids;  // sorted

    bool operator<(const RunScore& other) const {
        return std::tie(total, centrality, ids) < std::tie(other.total, other.centrality, other.ids);
    }
};

Cents sum_prices(const std::vector<SeatView>& seats) {
    Cents total = 0;
    for (const auto& s : seats) total += s.price;
    return total;
}

} // namespace

AllocationSelector::AllocationSelector(const SeatCatalog& catalog, const AvailabilityView& view)
    : catalog_(catalog), view_(view) {}

SelectionResult AllocationSelector::get_best_available_seats(const SelectionRequest& req) const {
    if (req.quantity <= 0) {
        return SelectionResult{false, ErrorCode::kInvalidRequest, "Quantity must be positive", {}, false, 0, 0};
    }

    ViewResult view = view_.get_available_seats(req.event_id, req.chart_id);
    if (!view.success) {
        return SelectionResult{false, view.error, view.message, {}, false, 0, 0};
    }
    const ChartId bound = catalog_.chart_for_event(req.event_id);
    if (!bound.empty() && bound != req.chart_id) {
        return SelectionResult{false, ErrorCode::kInvalidRequest,
                               "Chart " + req.chart_id + " is not the chart of event " + req.event_id,
                               {}, false, 0, 0};
    }

    std::vector<SeatView> candidates;
    for (auto& s : view.seats) {
        if (s.state != SeatState::kAvailable) continue;
        if (req.max_price && s.price > *req.max_price) continue;
        if (req.section_preference && s.section != *req.section_preference) continue;
        candidates.push_back(std::move(s));
    }

    const std::size_t quantity = static_cast<std::size_t>(req.quantity);
    if (candidates.size() < quantity) {
        return SelectionResult{false, ErrorCode::kInsufficientAvailability,
                               "Only " + std::to_string(candidates.size()) + " eligible seats, "
                                   + std::to_string(quantity) + " requested",
                               {}, false, candidates.size(), 0};
    }

    if (req.prefer_together) {
        std::vector<SeatView> run = best_contiguous_run(req.chart_id, candidates, req.quantity);
        if (!run.empty()) {
            const Cents total = sum_prices(run);
            return SelectionResult{true, ErrorCode::kNone, "Contiguous seats found",
                                   std::move(run), true, candidates.size(), total};
        }
        spdlog::debug("No contiguous run of {} seats for event {}; using cheapest-seat fallback",
                      quantity, req.event_id);
    }

    std::vector<SeatView> picked = cheapest_seats(candidates, req.quantity);
    const Cents total = sum_prices(picked);
    // A single seat is trivially contiguous.
    const bool contiguous = quantity == 1;
    return SelectionResult{true, ErrorCode::kNone, "Cheapest available seats",
                           std::move(picked), contiguous, candidates.size(), total};
}

std::vector<SeatView> AllocationSelector::best_contiguous_run(const ChartId& chart_id,
                                                              const std::vector<SeatView>& candidates,
                                                              int quantity) const {
    std::map<std::pair<std::string, std::string>, std::vector<const SeatView*>> rows;
    for (const auto& s : candidates) {
        rows[std::make_pair(s.section, s.row)].push_back(&s);
    }

    std::map<std::string, SectionBounds> bounds_cache;
    const std::size_t q = static_cast<std::size_t>(quantity);

    bool found = false;
    RunScore best;
    std::vector<const SeatView*> best_run;

    for (auto& kv : rows) {
        std::vector<const SeatView*>& row = kv.second;
        if (row.size() < q) continue;
        std::sort(row.begin(), row.end(), [](const SeatView* a, const SeatView* b) {
            return std::tie(a->number, a->seat_id) < std::tie(b->number, b->seat_id);
        });

        const std::string& section = kv.first.first;
        auto b = bounds_cache.find(section);
        if (b == bounds_cache.end()) {
            b = bounds_cache.emplace(section, catalog_.section_bounds(chart_id, section)).first;
        }
        const long long centre2 = static_cast<long long>(b->second.min_number) + b->second.max_number;

        for (std::size_t start = 0; start + q <= row.size(); ++start) {
            bool consecutive = true;
            for (std::size_t i = start + 1; i < start + q; ++i) {
                if (row[i]->number != row[i - 1]->number + 1) {
                    consecutive = false;
                    break;
                }
            }
            if (!consecutive) continue;

            RunScore score;
            for (std::size_t i = start; i < start + q; ++i) {
                score.total += row[i]->price;
                score.centrality += std::llabs(2LL * row[i]->number - centre2);
                score.ids.push_back(row[i]->seat_id);
            }
            std::sort(score.ids.begin(), score.ids.end());

            if (!found || score < best) {
                found = true;
                best = std::move(score);
                best_run.assign(row.begin() + start, row.begin() + start + q);
            }
        }
    }

    std::vector<SeatView> out;
    out.reserve(best_run.size());
    for (const SeatView* s : best_run) out.push_back(*s);
    return out;
}

std::vector<SeatView> AllocationSelector::cheapest_seats(std::vector<SeatView> candidates, int quantity) {
    std::sort(candidates.begin(), candidates.end(), [](const SeatView& a, const SeatView& b) {
        return std::tie(a.price, a.seat_id) < std::tie(b.price, b.seat_id);
    });
    candidates.resize(static_cast<std::size_t>(quantity));
    return candidates;
}

} // namespace seating
