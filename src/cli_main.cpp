#include "allocation_selector.hpp"
#include "availability_view.hpp"
#include "chart_loader.hpp"
#include "clock.hpp"
#include "engine_config.hpp"
#include "expiry_sweeper.hpp"
#include "hold_manager.hpp"
#include "in_memory_seat_store.hpp"
#include "purchase_finalizer.hpp"
#include "seat_catalog.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace seating;

static void print_help() {
    std::cout
        << "Commands:\n"
        << "  charts\n"
        << "  seats <event_id> <chart_id>\n"
        << "  summary <event_id> <chart_id>\n"
        << "  best <event_id> <chart_id> <qty> [together|any] [max_price|-] [section]\n"
        << "  session\n"
        << "  hold <event_id> <session_id> <minutes> <seat_id> ...\n"
        << "  extend <hold_id> <minutes>\n"
        << "  release hold <hold_id> ... | session <session_id> | event <event_id>\n"
        << "  status <session_id> <event_id>\n"
        << "  buy <session_id> <event_id> <order_id> [email]\n"
        << "  advance <minutes>\n"
        << "  sweep\n"
        << "  exit\n";
}

// Small sample venue (event "show-1" on chart "main") used when no chart file is configured.
static CatalogResult build_demo_catalog(SeatCatalog& catalog) {
    CatalogResult r = catalog.add_chart(SeatingChart{"main", "hall", "Main Hall", 1, true});
    if (!r.success) return r;
    r = catalog.add_category(SeatCategory{"std", "main", "Standard", "#3B82F6", 4000, 1.0, false, false, 0});
    if (!r.success) return r;
    r = catalog.add_category(SeatCategory{"prem", "main", "Premium", "#F59E0B", 4000, 1.5, false, true, 1});
    if (!r.success) return r;

    const char* rows[] = {"A", "B", "C"};
    for (const char* row : rows) {
        for (int n = 1; n <= 10; ++n) {
            Seat s;
            s.id = std::string(row) + std::to_string(n);
            s.chart_id = "main";
            s.section = "Floor";
            s.row = row;
            s.number = n;
            s.category_id = (n >= 4 && n <= 7) ? "prem" : "std";
            r = catalog.add_seat(s);
            if (!r.success) return r;
        }
    }

    EventOverrides ov;
    ov.event_id = "show-1";
    ov.chart_id = "main";
    return catalog.set_overrides(ov);
}

static std::string describe(const ErrorCode code, const std::string& message) {
    return std::string(to_string(code)) + ": " + message;
}

static void print_seats(const std::vector<SeatView>& seats) {
    for (const auto& s : seats) {
        std::cout << "  " << s.seat_id << "  " << s.section << " row " << s.row << " #" << s.number
                  << "  " << format_cents(s.price) << "  " << to_string(s.state)
                  << (s.category_name.empty() ? "" : "  [" + s.category_name + "]") << "\n";
    }
}

int main(int argc, char** argv) {
    EngineConfig config;
    if (argc > 1) {
        LoadResult r = EngineConfig::load_from_file(argv[1], config);
        if (!r.success) {
            std::cerr << r.message << "\n";
            return 1;
        }
    }
    config.apply_log_level();

    SeatCatalog catalog;
    if (!config.chart_file.empty()) {
        LoadResult r = load_chart_file(config.chart_file, catalog);
        if (!r.success) {
            std::cerr << r.message << "\n";
            return 1;
        }
    } else {
        CatalogResult r = build_demo_catalog(catalog);
        if (!r.success) {
            std::cerr << r.message << "\n";
            return 1;
        }
    }

    // The CLI runs on simulated time so holds can be aged with "advance".
    ManualClock clock;
    InMemorySeatStore store;
    AvailabilityView view(catalog, store, clock);
    AllocationSelector selector(catalog, view);
    HoldManager holds(catalog, store, clock, config);
    PurchaseFinalizer finalizer(store, clock);
    ExpirySweeper sweeper(store, clock, config.sweep_interval());
    sweeper.start();

    std::cout << "Seating Engine CLI\n";
    print_help();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            print_help();
        } else if (cmd == "charts") {
            for (const SeatingChart* chart : catalog.charts()) {
                std::cout << chart->id << ": " << chart->name << " ("
                          << catalog.seats_in_chart(chart->id).size() << " seats)\n";
                for (const SeatCategory* c : catalog.categories_in_chart(chart->id)) {
                    std::cout << "  " << c->id << ": " << c->name << " x" << c->price_modifier << "\n";
                }
            }
        } else if (cmd == "seats") {
            std::string event_id, chart_id;
            iss >> event_id >> chart_id;
            ViewResult r = view.get_available_seats(event_id, chart_id);
            if (!r.success) {
                std::cout << "FAIL: " << describe(r.error, r.message) << "\n";
                continue;
            }
            print_seats(r.seats);
        } else if (cmd == "summary") {
            std::string event_id, chart_id;
            iss >> event_id >> chart_id;
            AvailabilitySummary s = view.summarize(event_id, chart_id);
            if (!s.success) {
                std::cout << "FAIL: " << describe(s.error, s.message) << "\n";
                continue;
            }
            std::cout << "total=" << s.total << " available=" << s.available << " held=" << s.held
                      << " sold=" << s.sold << " inactive=" << s.inactive
                      << " revenue=" << format_cents(s.sold_revenue) << "\n";
        } else if (cmd == "best") {
            SelectionRequest req;
            std::string mode, max_price, section;
            iss >> req.event_id >> req.chart_id >> req.quantity >> mode >> max_price >> section;
            req.prefer_together = mode != "any";
            if (!max_price.empty() && max_price != "-") {
                try {
                    req.max_price = to_cents(std::stod(max_price));
                } catch (const std::exception&) {
                    std::cout << "Invalid max price: " << max_price << "\n";
                    continue;
                }
            }
            if (!section.empty()) req.section_preference = section;

            SelectionResult r = selector.get_best_available_seats(req);
            if (!r.success) {
                std::cout << "FAIL: " << describe(r.error, r.message) << "\n";
                continue;
            }
            std::cout << (r.contiguous ? "Together" : "Scattered") << ", total "
                      << format_cents(r.total_price) << ":\n";
            print_seats(r.seats);
        } else if (cmd == "session") {
            std::cout << holds.new_session_id() << "\n";
        } else if (cmd == "hold") {
            std::string event_id, session_id;
            int minutes = 0;
            iss >> event_id >> session_id >> minutes;
            std::vector<SeatId> seats;
            std::string s;
            while (iss >> s) seats.push_back(s);

            HoldResult r = holds.hold_seats(seats, event_id, session_id, minutes);
            if (!r.success) {
                std::cout << "FAIL: " << describe(r.error, r.message) << "\n";
                continue;
            }
            std::cout << "OK: batch " << r.batch.batch_id << "\n";
            for (std::size_t i = 0; i < r.batch.hold_ids.size(); ++i) {
                std::cout << "  " << r.batch.hold_ids[i] << " -> " << r.batch.seat_ids[i] << "\n";
            }
        } else if (cmd == "extend") {
            std::string hold_id;
            int minutes = 0;
            iss >> hold_id >> minutes;
            ExtendResult r = holds.extend_hold(hold_id, minutes);
            std::cout << (r.success ? "OK: " : "FAIL: ") << describe(r.error, r.message) << "\n";
        } else if (cmd == "release") {
            std::string kind;
            iss >> kind;
            HoldFilter filter;
            std::string v;
            if (kind == "hold") {
                std::vector<HoldId> ids;
                while (iss >> v) ids.push_back(v);
                filter.hold_ids = ids;
            } else if (kind == "session" && (iss >> v)) {
                filter.session_id = v;
            } else if (kind == "event" && (iss >> v)) {
                filter.event_id = v;
            }
            ReleaseResult r = holds.release_holds(filter);
            std::cout << (r.success ? "OK: " : "FAIL: ") << r.message << "\n";
        } else if (cmd == "status") {
            std::string session_id, event_id;
            iss >> session_id >> event_id;
            std::vector<HoldStatusView> st = holds.hold_status(session_id, event_id);
            if (st.empty()) {
                std::cout << "No holds for session " << session_id << "\n";
            }
            for (const auto& h : st) {
                std::cout << "  " << h.hold_id << "  " << h.seat_id << "  " << to_string(h.status)
                          << "  " << h.minutes_remaining << " min left\n";
            }
        } else if (cmd == "buy") {
            std::string session_id, event_id, order_id;
            CustomerInfo customer;
            iss >> session_id >> event_id >> order_id >> customer.email;
            FinalizeResult r = finalizer.complete_purchase(session_id, event_id, order_id, customer);
            if (!r.success) {
                std::cout << "FAIL: " << describe(r.error, r.message) << "\n";
                for (const auto& id : r.expired_seat_ids) std::cout << "  expired: " << id << "\n";
                continue;
            }
            std::cout << "OK: sold";
            for (const auto& id : r.seat_ids) std::cout << " " << id;
            std::cout << "\n";
        } else if (cmd == "advance") {
            int minutes = 0;
            iss >> minutes;
            clock.advance(std::chrono::minutes(minutes));
            std::cout << "Clock advanced " << minutes << " min\n";
        } else if (cmd == "sweep") {
            std::cout << "Expired " << sweeper.sweep_once() << " holds\n";
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    sweeper.stop();
    return 0;
}
