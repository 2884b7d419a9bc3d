#include "chart_loader.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace seating {

namespace {

void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }

void try_get_price(const YAML::Node& n, const char* key, Cents& v) {
    if (n[key]) v = to_cents(n[key].as<double>());
}

std::string required(const YAML::Node& n, const char* key, const char* what) {
    if (!n[key]) {
        throw std::runtime_error(std::string(what) + " entry is missing '" + key + "'");
    }
    return n[key].as<std::string>();
}

LoadResult fail(const CatalogResult& r) {
    return LoadResult{false, r.message};
}

LoadResult parse(const YAML::Node& root, SeatCatalog& out) {
    if (!root.IsMap()) {
        return LoadResult{false, "Chart document root must be a mapping"};
    }

    SeatCatalog catalog;

    for (const auto& n : root["charts"]) {
        SeatingChart c;
        c.id = required(n, "id", "chart");
        try_get(n, "venue_id", c.venue_id);
        try_get(n, "name", c.name);
        try_get(n, "version", c.version);
        try_get(n, "active", c.active);
        CatalogResult r = catalog.add_chart(c);
        if (!r.success) return fail(r);
    }

    for (const auto& n : root["categories"]) {
        SeatCategory c;
        c.id = required(n, "id", "category");
        c.chart_id = required(n, "chart_id", "category");
        try_get(n, "name", c.name);
        try_get(n, "color", c.color);
        try_get_price(n, "base_price", c.base_price);
        try_get(n, "price_modifier", c.price_modifier);
        try_get(n, "accessible", c.accessible);
        try_get(n, "premium", c.premium);
        try_get(n, "sort_order", c.sort_order);
        if (c.name.empty()) c.name = c.id;
        CatalogResult r = catalog.add_category(c);
        if (!r.success) return fail(r);
    }

    for (const auto& n : root["seats"]) {
        Seat s;
        s.id = required(n, "id", "seat");
        s.chart_id = required(n, "chart_id", "seat");
        try_get(n, "section", s.section);
        try_get(n, "row", s.row);
        try_get(n, "number", s.number);
        try_get(n, "category_id", s.category_id);
        try_get(n, "accessible", s.accessible);
        try_get(n, "premium", s.premium);
        try_get(n, "active", s.active);
        if (n["base_price"]) s.base_price = to_cents(n["base_price"].as<double>());
        if (n["x"]) s.x = n["x"].as<double>();
        if (n["y"]) s.y = n["y"].as<double>();
        CatalogResult r = catalog.add_seat(s);
        if (!r.success) return fail(r);
    }

    for (const auto& n : root["rows"]) {
        Seat tmpl;
        tmpl.chart_id = required(n, "chart_id", "row");
        tmpl.row = required(n, "row", "row");
        try_get(n, "section", tmpl.section);
        try_get(n, "category_id", tmpl.category_id);
        try_get(n, "accessible", tmpl.accessible);
        try_get(n, "premium", tmpl.premium);
        if (n["base_price"]) tmpl.base_price = to_cents(n["base_price"].as<double>());

        int first = 1;
        int last = 0;
        std::string prefix = tmpl.row;
        try_get(n, "first", first);
        try_get(n, "last", last);
        try_get(n, "id_prefix", prefix);
        if (last < first) {
            return LoadResult{false, "Row " + tmpl.row + " has last < first"};
        }

        for (int num = first; num <= last; ++num) {
            Seat s = tmpl;
            s.number = num;
            s.id = prefix + std::to_string(num);
            CatalogResult r = catalog.add_seat(s);
            if (!r.success) return fail(r);
        }
    }

    for (const auto& n : root["events"]) {
        EventOverrides ov;
        ov.event_id = required(n, "id", "event");
        ov.chart_id = required(n, "chart_id", "event");
        for (const auto& kv : n["seat_prices"]) {
            ov.seat_prices[kv.first.as<std::string>()] = to_cents(kv.second.as<double>());
        }
        for (const auto& kv : n["category_multipliers"]) {
            ov.category_multipliers[kv.first.as<std::string>()] = kv.second.as<double>();
        }
        for (const auto& kv : n["seat_availability"]) {
            ov.seat_availability[kv.first.as<std::string>()] = kv.second.as<bool>();
        }
        CatalogResult r = catalog.set_overrides(ov);
        if (!r.success) return fail(r);
    }

    spdlog::info("Loaded seating catalog: {} seats, {} categories", catalog.seat_count(), catalog.category_count());
    out = std::move(catalog);
    return LoadResult{true, ""};
}

} // namespace

Cents to_cents(double amount) {
    return static_cast<Cents>(std::llround(amount * 100.0));
}

LoadResult load_chart_file(const std::string& path, SeatCatalog& out) {
    try {
        return parse(YAML::LoadFile(path), out);
    } catch (const YAML::Exception& e) {
        return LoadResult{false, "Failed to read chart " + path + ": " + e.what()};
    } catch (const std::runtime_error& e) {
        return LoadResult{false, "Invalid chart " + path + ": " + e.what()};
    }
}

LoadResult load_chart_string(const std::string& yaml, SeatCatalog& out) {
    try {
        return parse(YAML::Load(yaml), out);
    } catch (const YAML::Exception& e) {
        return LoadResult{false, std::string("Failed to parse chart: ") + e.what()};
    } catch (const std::runtime_error& e) {
        return LoadResult{false, std::string("Invalid chart: ") + e.what()};
    }
}

} // namespace seating
