#include "seat_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace seating {

CatalogResult SeatCatalog::add_chart(const SeatingChart& chart) {
    if (chart.id.empty()) {
        return CatalogResult{false, "Chart id must not be empty"};
    }
    if (chart_index_.count(chart.id) != 0) {
        return CatalogResult{false, "Duplicate chart id: " + chart.id};
    }
    chart_index_.emplace(chart.id, charts_.size());
    charts_.push_back(chart);
    chart_seats_[chart.id];
    chart_categories_[chart.id];
    return CatalogResult{true, ""};
}

CatalogResult SeatCatalog::add_category(const SeatCategory& category) {
    if (category.id.empty()) {
        return CatalogResult{false, "Category id must not be empty"};
    }
    if (category_index_.count(category.id) != 0) {
        return CatalogResult{false, "Duplicate category id: " + category.id};
    }
    if (chart_index_.count(category.chart_id) == 0) {
        return CatalogResult{false, "Unknown chart for category " + category.id + ": " + category.chart_id};
    }
    if (!(category.price_modifier > 0.0)) {
        return CatalogResult{false, "Price modifier must be positive for category " + category.id};
    }
    for (std::size_t idx : chart_categories_[category.chart_id]) {
        if (categories_[idx].name == category.name) {
            return CatalogResult{false, "Duplicate category name in chart: " + category.name};
        }
    }

    const std::size_t idx = categories_.size();
    categories_.push_back(category);
    category_index_.emplace(category.id, idx);
    chart_categories_[category.chart_id].push_back(idx);
    return CatalogResult{true, ""};
}

CatalogResult SeatCatalog::add_seat(const Seat& seat) {
    if (seat.id.empty()) {
        return CatalogResult{false, "Seat id must not be empty"};
    }
    if (seat_index_.count(seat.id) != 0) {
        return CatalogResult{false, "Duplicate seat id: " + seat.id};
    }
    if (chart_index_.count(seat.chart_id) == 0) {
        return CatalogResult{false, "Unknown chart for seat " + seat.id + ": " + seat.chart_id};
    }
    if (!seat.category_id.empty()) {
        const SeatCategory* cat = find_category(seat.category_id);
        if (!cat) {
            return CatalogResult{false, "Unknown category for seat " + seat.id + ": " + seat.category_id};
        }
        if (cat->chart_id != seat.chart_id) {
            return CatalogResult{false, "Category " + seat.category_id + " belongs to another chart"};
        }
    }
    if (seat.base_price && *seat.base_price < 0) {
        return CatalogResult{false, "Negative base price for seat " + seat.id};
    }

    const std::size_t idx = seats_.size();
    seats_.push_back(seat);
    seat_index_.emplace(seat.id, idx);
    chart_seats_[seat.chart_id].push_back(idx);
    return CatalogResult{true, ""};
}

CatalogResult SeatCatalog::set_overrides(const EventOverrides& overrides) {
    if (overrides.event_id.empty()) {
        return CatalogResult{false, "Event id must not be empty"};
    }
    if (chart_index_.count(overrides.chart_id) == 0) {
        return CatalogResult{false, "Unknown chart for event " + overrides.event_id + ": " + overrides.chart_id};
    }

    auto seat_in_chart = [&](const SeatId& id) {
        const Seat* s = find_seat(id);
        return s != nullptr && s->chart_id == overrides.chart_id;
    };

    for (const auto& kv : overrides.seat_prices) {
        if (!seat_in_chart(kv.first)) {
            return CatalogResult{false, "Price override for unknown seat: " + kv.first};
        }
        if (kv.second < 0) {
            return CatalogResult{false, "Negative price override for seat: " + kv.first};
        }
    }
    for (const auto& kv : overrides.seat_availability) {
        if (!seat_in_chart(kv.first)) {
            return CatalogResult{false, "Availability override for unknown seat: " + kv.first};
        }
    }
    for (const auto& kv : overrides.category_multipliers) {
        const SeatCategory* cat = find_category(kv.first);
        if (!cat || cat->chart_id != overrides.chart_id) {
            return CatalogResult{false, "Multiplier override for unknown category: " + kv.first};
        }
        if (!(kv.second > 0.0)) {
            return CatalogResult{false, "Multiplier must be positive for category: " + kv.first};
        }
    }

    auto it = overrides_index_.find(overrides.event_id);
    if (it != overrides_index_.end()) {
        overrides_[it->second] = overrides;
    } else {
        overrides_index_.emplace(overrides.event_id, overrides_.size());
        overrides_.push_back(overrides);
    }
    return CatalogResult{true, ""};
}

std::vector<const SeatingChart*> SeatCatalog::charts() const {
    std::vector<const SeatingChart*> out;
    out.reserve(charts_.size());
    for (const auto& c : charts_) out.push_back(&c);
    return out;
}

const SeatingChart* SeatCatalog::find_chart(const ChartId& chart_id) const {
    auto it = chart_index_.find(chart_id);
    if (it == chart_index_.end()) return nullptr;
    return &charts_[it->second];
}

const Seat* SeatCatalog::find_seat(const SeatId& seat_id) const {
    auto it = seat_index_.find(seat_id);
    if (it == seat_index_.end()) return nullptr;
    return &seats_[it->second];
}

const SeatCategory* SeatCatalog::find_category(const CategoryId& category_id) const {
    auto it = category_index_.find(category_id);
    if (it == category_index_.end()) return nullptr;
    return &categories_[it->second];
}

const EventOverrides* SeatCatalog::find_overrides(const EventId& event_id) const {
    auto it = overrides_index_.find(event_id);
    if (it == overrides_index_.end()) return nullptr;
    return &overrides_[it->second];
}

ChartId SeatCatalog::chart_for_event(const EventId& event_id) const {
    const EventOverrides* ov = find_overrides(event_id);
    return ov ? ov->chart_id : ChartId();
}

std::vector<const Seat*> SeatCatalog::seats_in_chart(const ChartId& chart_id) const {
    std::vector<const Seat*> out;
    auto it = chart_seats_.find(chart_id);
    if (it == chart_seats_.end()) return out;

    out.reserve(it->second.size());
    for (std::size_t idx : it->second) {
        out.push_back(&seats_[idx]);
    }
    std::sort(out.begin(), out.end(), [](const Seat* a, const Seat* b) {
        return std::tie(a->section, a->row, a->number, a->id)
             < std::tie(b->section, b->row, b->number, b->id);
    });
    return out;
}

std::vector<const SeatCategory*> SeatCatalog::categories_in_chart(const ChartId& chart_id) const {
    std::vector<const SeatCategory*> out;
    auto it = chart_categories_.find(chart_id);
    if (it == chart_categories_.end()) return out;

    for (std::size_t idx : it->second) {
        out.push_back(&categories_[idx]);
    }
    std::sort(out.begin(), out.end(), [](const SeatCategory* a, const SeatCategory* b) {
        return std::tie(a->sort_order, a->name) < std::tie(b->sort_order, b->name);
    });
    return out;
}

SectionBounds SeatCatalog::section_bounds(const ChartId& chart_id, const std::string& section) const {
    SectionBounds bounds;
    bool first = true;
    auto it = chart_seats_.find(chart_id);
    if (it == chart_seats_.end()) return bounds;

    for (std::size_t idx : it->second) {
        const Seat& s = seats_[idx];
        if (s.section != section) continue;
        if (first) {
            bounds.min_number = s.number;
            bounds.max_number = s.number;
            first = false;
        } else {
            bounds.min_number = std::min(bounds.min_number, s.number);
            bounds.max_number = std::max(bounds.max_number, s.number);
        }
    }
    return bounds;
}

Cents SeatCatalog::effective_price(const Seat& seat,
                                   const SeatCategory* category,
                                   const EventOverrides* overrides) {
    if (overrides) {
        auto it = overrides->seat_prices.find(seat.id);
        if (it != overrides->seat_prices.end()) {
            return it->second;
        }
    }

    Cents base = 0;
    if (seat.base_price) {
        base = *seat.base_price;
    } else if (category) {
        base = category->base_price;
    }

    double multiplier = 1.0;
    if (category) {
        multiplier = category->price_modifier;
        if (overrides) {
            auto it = overrides->category_multipliers.find(category->id);
            if (it != overrides->category_multipliers.end()) {
                multiplier = it->second;
            }
        }
    }

    return static_cast<Cents>(std::llround(static_cast<double>(base) * multiplier));
}

bool SeatCatalog::effective_availability(const Seat& seat, const EventOverrides* overrides) {
    if (!seat.active) return false;
    if (overrides) {
        auto it = overrides->seat_availability.find(seat.id);
        if (it != overrides->seat_availability.end()) {
            return it->second;
        }
    }
    return true;
}

Cents SeatCatalog::price_for_event(const Seat& seat, const EventId& event_id) const {
    const SeatCategory* cat = seat.category_id.empty() ? nullptr : find_category(seat.category_id);
    return effective_price(seat, cat, find_overrides(event_id));
}

bool SeatCatalog::available_for_event(const Seat& seat, const EventId& event_id) const {
    return effective_availability(seat, find_overrides(event_id));
}

} // namespace seating
