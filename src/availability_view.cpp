#include "availability_view.hpp"

#include <map>
#include <utility>

namespace seating {

AvailabilityView::AvailabilityView(const SeatCatalog& catalog, const SeatStore& store, const Clock& clock)
    : catalog_(catalog), store_(store), clock_(clock) {}

ViewResult AvailabilityView::get_available_seats(const EventId& event_id, const ChartId& chart_id) const {
    if (!catalog_.find_chart(chart_id)) {
        return ViewResult{false, ErrorCode::kChartNotFound, "Chart not found: " + chart_id, {}};
    }

    const std::vector<const Seat*> seats = catalog_.seats_in_chart(chart_id);
    std::vector<SeatId> ids;
    ids.reserve(seats.size());
    for (const Seat* s : seats) ids.push_back(s->id);

    const std::map<SeatId, SeatState> live = store_.query_seat_states(event_id, ids, clock_.now());
    const EventOverrides* overrides = catalog_.find_overrides(event_id);

    ViewResult result{true, ErrorCode::kNone, "", {}};
    result.seats.reserve(seats.size());
    for (const Seat* s : seats) {
        const SeatCategory* cat = s->category_id.empty() ? nullptr : catalog_.find_category(s->category_id);

        SeatView v;
        v.seat_id = s->id;
        v.section = s->section;
        v.row = s->row;
        v.number = s->number;
        v.x = s->x;
        v.y = s->y;
        v.category_id = s->category_id;
        if (cat) {
            v.category_name = cat->name;
            v.category_color = cat->color;
        }
        v.price = SeatCatalog::effective_price(*s, cat, overrides);
        v.accessible = s->accessible || (cat && cat->accessible);
        v.premium = s->premium || (cat && cat->premium);

        auto it = live.find(s->id);
        if (it != live.end()) {
            v.state = it->second;
        } else if (!SeatCatalog::effective_availability(*s, overrides)) {
            v.state = SeatState::kInactive;
        } else {
            v.state = SeatState::kAvailable;
        }
        result.seats.push_back(std::move(v));
    }
    return result;
}

AvailabilitySummary AvailabilityView::summarize(const EventId& event_id, const ChartId& chart_id) const {
    AvailabilitySummary summary;
    ViewResult view = get_available_seats(event_id, chart_id);
    if (!view.success) {
        summary.error = view.error;
        summary.message = view.message;
        return summary;
    }

    summary.success = true;
    summary.total = view.seats.size();
    for (const auto& v : view.seats) {
        switch (v.state) {
            case SeatState::kAvailable: ++summary.available; break;
            case SeatState::kHeld:      ++summary.held; break;
            case SeatState::kInactive:  ++summary.inactive; break;
            case SeatState::kSold:
                ++summary.sold;
                summary.sold_revenue += v.price;
                break;
        }
    }
    return summary;
}

} // namespace seating
