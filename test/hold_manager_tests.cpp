#include <gtest/gtest.h>

#include "test_support.hpp"

#include <atomic>
#include <map>
#include <thread>
#include <vector>

using namespace seating;
using seating_test::EngineTest;

using HoldManagerTest = EngineTest;

// ---------- Test double: store with transient contention ----------
namespace {

/**
 * Forwards to an InMemorySeatStore but answers N acquisitions with kTransient,
 * like a relational store reporting a serialization failure. The first
 * @p pass_first acquisitions go through untouched.
 */
class FlakySeatStore : public SeatStore {
public:
    explicit FlakySeatStore(int transient_failures, int pass_first = 0)
        : remaining_(transient_failures), pass_first_(pass_first) {}

    AcquireResult try_acquire_hold(const HoldRequest& req) override {
        ++acquire_calls;
        if (pass_first_ > 0) {
            --pass_first_;
            return inner.try_acquire_hold(req);
        }
        if (remaining_ > 0) {
            --remaining_;
            return AcquireResult{AcquireResult::Status::kTransient, SeatHold{}};
        }
        return inner.try_acquire_hold(req);
    }
    SeatState seat_state(const EventId& e, const SeatId& s, Timestamp now) const override {
        return inner.seat_state(e, s, now);
    }
    std::map<SeatId, SeatState> query_seat_states(const EventId& e, const std::vector<SeatId>& ids,
                                                  Timestamp now) const override {
        return inner.query_seat_states(e, ids, now);
    }
    std::size_t release_holds(const HoldFilter& f, Timestamp now) override { return inner.release_holds(f, now); }
    ExtendOutcome extend_hold(const HoldId& id, std::chrono::minutes m, Timestamp now) override {
        return inner.extend_hold(id, m, now);
    }
    std::vector<HoldId> find_lapsed_holds(Timestamp now) const override { return inner.find_lapsed_holds(now); }
    std::size_t mark_expired(const std::vector<HoldId>& ids, Timestamp now) override {
        return inner.mark_expired(ids, now);
    }
    CommitResult commit_sale(const SaleRequest& req) override { return inner.commit_sale(req); }
    std::optional<SeatHold> find_hold(const HoldId& id) const override { return inner.find_hold(id); }
    std::vector<SeatHold> holds_for_session(const SessionId& s, const EventId& e) const override {
        return inner.holds_for_session(s, e);
    }
    std::vector<SoldSeat> sold_seats(const EventId& e) const override { return inner.sold_seats(e); }

    InMemorySeatStore inner;
    int acquire_calls = 0;

private:
    int remaining_;
    int pass_first_;
};

} // namespace

// ---------- Tests: request validation ----------
TEST_F(HoldManagerTest, RejectEmptyRequest) {
    HoldResult r = hold({}, "s1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kInvalidRequest);
}

TEST_F(HoldManagerTest, RejectEmptySessionAndNegativeDuration) {
    EXPECT_EQ(hold({"A1"}, "").error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(hold({"A1"}, "s1", -5).error, ErrorCode::kInvalidRequest);
}

TEST_F(HoldManagerTest, DurationIsCappedByMaxHoldMinutes) {
    const int max = seating_test::fast_config().max_hold_minutes;
    const Timestamp t0 = clock.now();

    HoldResult at_max = hold({"A1"}, "s1", max);
    ASSERT_TRUE(at_max.success) << at_max.message;
    EXPECT_EQ(at_max.batch.expires_at, t0 + std::chrono::minutes(max));

    EXPECT_EQ(hold({"A2"}, "s1", max + 1).error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(hold({"A2"}, "s1", 200000000).error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(state("A2"), SeatState::kAvailable);
}

TEST_F(HoldManagerTest, RejectDuplicateSeatsInSameRequest) {
    HoldResult r = hold({"A1", "A2", "A1"}, "s1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kInvalidRequest);
    EXPECT_TRUE(r.message.find("Duplicate") != std::string::npos);
    EXPECT_EQ(state("A2"), SeatState::kAvailable);
}

TEST_F(HoldManagerTest, RejectUnknownSeat) {
    HoldResult r = hold({"A1", "Z99"}, "s1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kSeatNotFound);
    EXPECT_EQ(state("A1"), SeatState::kAvailable);
}

TEST_F(HoldManagerTest, RejectSeatsFromAnotherChart) {
    seating_test::add_chart(catalog, "annex");
    seating_test::add_row(catalog, "annex", "Annex", "X", 1, 2, 1000);

    EXPECT_EQ(hold({"A1", "X1"}, "s1").error, ErrorCode::kInvalidRequest);
    // ev1 is bound to "hall".
    EXPECT_EQ(hold({"X1"}, "s1").error, ErrorCode::kInvalidRequest);
    // An unbound event accepts any single chart.
    EXPECT_TRUE(holds.hold_seats({"X1", "X2"}, "ev-annex", "s1").success);
}

TEST_F(HoldManagerTest, SeatsOutOfSaleAreUnavailable) {
    EventOverrides ov;
    ov.event_id = kEvent;
    ov.chart_id = kChart;
    ov.seat_availability["A3"] = false;
    ASSERT_TRUE(catalog.set_overrides(ov).success);

    HoldResult r = hold({"A2", "A3"}, "s1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kSeatUnavailable);
    EXPECT_EQ(r.blocked_seat_ids, std::vector<SeatId>{"A3"});
    EXPECT_EQ(state("A2"), SeatState::kAvailable);
}

// ---------- Tests: successful holds ----------
TEST_F(HoldManagerTest, HoldBatchSharesIdAndExpiry) {
    const Timestamp t0 = clock.now();
    HoldResult r = hold({"A3", "A1", "A2"}, "s1", 10);
    ASSERT_TRUE(r.success) << r.message;

    const std::vector<SeatId> expected = {"A1", "A2", "A3"};
    EXPECT_EQ(r.batch.seat_ids, expected);
    ASSERT_EQ(r.batch.hold_ids.size(), 3u);
    EXPECT_EQ(r.batch.expires_at, t0 + std::chrono::minutes(10));
    EXPECT_EQ(r.batch.batch_id.rfind("batch_", 0), 0u);

    for (std::size_t i = 0; i < r.batch.hold_ids.size(); ++i) {
        std::optional<SeatHold> h = store.find_hold(r.batch.hold_ids[i]);
        ASSERT_TRUE(h.has_value());
        EXPECT_EQ(h->seat_id, expected[i]);
        EXPECT_EQ(h->batch_id, r.batch.batch_id);
        EXPECT_EQ(h->session_id, "s1");
        EXPECT_EQ(h->status, HoldStatus::kActive);
        EXPECT_EQ(h->expires_at, r.batch.expires_at);
        EXPECT_EQ(h->duration_minutes, 10);
    }
}

TEST_F(HoldManagerTest, DefaultDurationComesFromConfig) {
    const Timestamp t0 = clock.now();
    HoldResult r = holds.hold_seats({"A1"}, kEvent, "s1", 0, "buyer@example.com");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.batch.expires_at, t0 + std::chrono::minutes(15));
    EXPECT_EQ(store.find_hold(r.batch.hold_ids[0])->customer_email, "buyer@example.com");
}

// ---------- Tests: all-or-nothing ----------
TEST_F(HoldManagerTest, AllOrNothingHold) {
    ASSERT_TRUE(hold({"A1"}, "s1").success);

    HoldResult r = hold({"A1", "A2"}, "s2");
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kSeatUnavailable);
    EXPECT_EQ(r.blocked_seat_ids, std::vector<SeatId>{"A1"});

    // A2 was not held as a side effect.
    EXPECT_EQ(state("A2"), SeatState::kAvailable);
    EXPECT_TRUE(store.holds_for_session("s2", kEvent).empty());
}

TEST_F(HoldManagerTest, ReportsEveryBlockingSeat) {
    ASSERT_TRUE(hold({"A2"}, "s1").success);
    ASSERT_TRUE(hold({"A4"}, "s3").success);

    HoldResult r = hold({"A1", "A2", "A3", "A4"}, "s2");
    ASSERT_FALSE(r.success);
    const std::vector<SeatId> expected = {"A2", "A4"};
    EXPECT_EQ(r.blocked_seat_ids, expected);
}

TEST_F(HoldManagerTest, SoldSeatCannotBeHeld) {
    ASSERT_TRUE(hold({"B1"}, "s1").success);
    ASSERT_TRUE(finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{}).success);

    clock.advance(std::chrono::hours(2));
    HoldResult r = hold({"B1"}, "s2");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kSeatUnavailable);
    expect_no_sold_and_held();
}

// ---------- Tests: release ----------
TEST_F(HoldManagerTest, HoldThenReleaseRestoresAvailability) {
    const ViewResult before = view.get_available_seats(kEvent, kChart);

    HoldResult r = hold({"A1", "A2", "A3", "A4"}, "s1");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(state("A1"), SeatState::kHeld);

    HoldFilter f;
    f.hold_ids = r.batch.hold_ids;
    ReleaseResult rel = holds.release_holds(f);
    ASSERT_TRUE(rel.success);
    EXPECT_EQ(rel.released, 4u);

    const ViewResult after = view.get_available_seats(kEvent, kChart);
    ASSERT_EQ(after.seats.size(), before.seats.size());
    for (std::size_t i = 0; i < after.seats.size(); ++i) {
        EXPECT_EQ(after.seats[i].seat_id, before.seats[i].seat_id);
        EXPECT_EQ(after.seats[i].state, before.seats[i].state);
    }
}

TEST_F(HoldManagerTest, ReleaseIsIdempotent) {
    HoldResult r = hold({"A1"}, "s1");
    ASSERT_TRUE(r.success);

    HoldFilter f;
    f.hold_ids = r.batch.hold_ids;
    EXPECT_EQ(holds.release_holds(f).released, 1u);

    ReleaseResult again = holds.release_holds(f);
    EXPECT_TRUE(again.success);
    EXPECT_EQ(again.released, 0u);
}

TEST_F(HoldManagerTest, ReleasingExpiredHoldCountsZero) {
    HoldResult r = hold({"A1"}, "s1", 1);
    ASSERT_TRUE(r.success);
    clock.advance(std::chrono::minutes(2));

    HoldFilter f;
    f.hold_ids = r.batch.hold_ids;
    ReleaseResult rel = holds.release_holds(f);
    EXPECT_TRUE(rel.success);
    EXPECT_EQ(rel.released, 0u);
}

TEST_F(HoldManagerTest, ReleaseRequiresAFilter) {
    ReleaseResult rel = holds.release_holds(HoldFilter{});
    EXPECT_FALSE(rel.success);
    EXPECT_EQ(rel.error, ErrorCode::kInvalidRequest);
}

TEST_F(HoldManagerTest, ReleaseFiltersAreAConjunction) {
    ASSERT_TRUE(hold({"A1"}, "s1").success);
    ASSERT_TRUE(holds.hold_seats({"A1"}, "ev2", "s1").success);
    ASSERT_TRUE(hold({"A2"}, "s2").success);

    HoldFilter f;
    f.session_id = "s1";
    f.event_id = kEvent;
    EXPECT_EQ(holds.release_holds(f).released, 1u);
    EXPECT_EQ(store.seat_state("ev2", "A1", clock.now()), SeatState::kHeld);
    EXPECT_EQ(state("A2"), SeatState::kHeld);

    HoldFilter by_event;
    by_event.event_id = kEvent;
    EXPECT_EQ(holds.release_holds(by_event).released, 1u);
    EXPECT_EQ(state("A2"), SeatState::kAvailable);
}

// ---------- Tests: expiry ----------
TEST_F(HoldManagerTest, ExpiredHoldIsReclaimedLazily) {
    HoldResult first = hold({"A1"}, "s1", 1);
    ASSERT_TRUE(first.success);

    clock.advance(std::chrono::seconds(61));
    // No sweep has run: the new hold must still succeed.
    HoldResult second = hold({"A1"}, "s2");
    ASSERT_TRUE(second.success) << second.message;

    EXPECT_EQ(store.find_hold(first.batch.hold_ids[0])->status, HoldStatus::kExpired);
    EXPECT_EQ(store.find_hold(second.batch.hold_ids[0])->session_id, "s2");
}

TEST_F(HoldManagerTest, HoldIsStillExclusiveJustBeforeExpiry) {
    ASSERT_TRUE(hold({"A1"}, "s1", 1).success);
    clock.advance(std::chrono::seconds(59));
    EXPECT_EQ(hold({"A1"}, "s2").error, ErrorCode::kSeatUnavailable);
}

// ---------- Tests: extend ----------
TEST_F(HoldManagerTest, ExtendActiveHold) {
    HoldResult r = hold({"A1"}, "s1", 5);
    ASSERT_TRUE(r.success);

    ExtendResult e = holds.extend_hold(r.batch.hold_ids[0], 10);
    ASSERT_TRUE(e.success) << e.message;
    EXPECT_EQ(e.expires_at, r.batch.expires_at + std::chrono::minutes(10));
    EXPECT_EQ(store.find_hold(r.batch.hold_ids[0])->status, HoldStatus::kExtended);

    // Past the original expiry the seat is still protected.
    clock.advance(std::chrono::minutes(7));
    EXPECT_EQ(hold({"A1"}, "s2").error, ErrorCode::kSeatUnavailable);
}

TEST_F(HoldManagerTest, ExtendErrors) {
    HoldResult r = hold({"A1"}, "s1", 1);
    ASSERT_TRUE(r.success);
    const HoldId id = r.batch.hold_ids[0];

    EXPECT_EQ(holds.extend_hold("missing", 5).error, ErrorCode::kHoldNotFound);
    EXPECT_EQ(holds.extend_hold(id, 0).error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(holds.extend_hold(id, -3).error, ErrorCode::kInvalidRequest);

    ASSERT_TRUE(holds.extend_hold(id, 1).success);
    EXPECT_EQ(holds.extend_hold(id, 1).error, ErrorCode::kHoldNotActive);

    clock.advance(std::chrono::minutes(3));
    EXPECT_EQ(holds.extend_hold(id, 1).error, ErrorCode::kHoldExpired);
}

TEST_F(HoldManagerTest, ExtensionIsCappedByMaxHoldMinutes) {
    const int max = seating_test::fast_config().max_hold_minutes;
    HoldResult r = hold({"A1", "A2"}, "s1", 5);
    ASSERT_TRUE(r.success);

    ExtendResult over = holds.extend_hold(r.batch.hold_ids[0], max + 1);
    EXPECT_EQ(over.error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(store.find_hold(r.batch.hold_ids[0])->status, HoldStatus::kActive);
    EXPECT_EQ(holds.extend_hold(r.batch.hold_ids[0], 2000000000).error, ErrorCode::kInvalidRequest);

    ExtendResult at_max = holds.extend_hold(r.batch.hold_ids[1], max);
    ASSERT_TRUE(at_max.success) << at_max.message;
    EXPECT_EQ(at_max.expires_at, r.batch.expires_at + std::chrono::minutes(max));
}

TEST_F(HoldManagerTest, CannotExtendReleasedHold) {
    HoldResult r = hold({"A1"}, "s1");
    ASSERT_TRUE(r.success);
    HoldFilter f;
    f.session_id = "s1";
    ASSERT_EQ(holds.release_holds(f).released, 1u);
    EXPECT_EQ(holds.extend_hold(r.batch.hold_ids[0], 5).error, ErrorCode::kHoldNotActive);
}

// ---------- Tests: hold status ----------
TEST_F(HoldManagerTest, HoldStatusReportsRemainingMinutes) {
    ASSERT_TRUE(hold({"A2"}, "s1", 10).success);
    clock.advance(std::chrono::minutes(1));
    ASSERT_TRUE(hold({"A1"}, "s1", 2).success);
    clock.advance(std::chrono::seconds(90));

    std::vector<HoldStatusView> st = holds.hold_status("s1", kEvent);
    ASSERT_EQ(st.size(), 2u);
    EXPECT_EQ(st[0].seat_id, "A2");
    EXPECT_EQ(st[0].status, HoldStatus::kActive);
    EXPECT_EQ(st[0].minutes_remaining, 7);   // 10 min - 2.5 min, floored
    EXPECT_EQ(st[0].row, "A");
    EXPECT_EQ(st[0].number, 2);
    EXPECT_EQ(st[1].seat_id, "A1");
    EXPECT_EQ(st[1].minutes_remaining, 0);   // 30 s left

    clock.advance(std::chrono::minutes(1));
    st = holds.hold_status("s1", kEvent);
    EXPECT_EQ(st[1].status, HoldStatus::kExpired);
    EXPECT_TRUE(holds.hold_status("nobody", kEvent).empty());
}

TEST_F(HoldManagerTest, NewSessionIdsAreDistinct) {
    const std::string a = holds.new_session_id();
    const std::string b = holds.new_session_id();
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("session_", 0), 0u);
}

// ---------- Tests: transient contention ----------
TEST_F(HoldManagerTest, TransientConflictsAreRetried) {
    FlakySeatStore flaky(2);
    HoldManager mgr(catalog, flaky, clock, seating_test::fast_config());

    HoldResult r = mgr.hold_seats({"A1"}, kEvent, "s1");
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(flaky.acquire_calls, 3);
}

TEST_F(HoldManagerTest, ExhaustedRetriesSurfaceAsUnavailableAndRollBack) {
    // A1 goes through, then every attempt on A2 is transient.
    EngineConfig cfg = seating_test::fast_config();
    cfg.retry_attempts = 3;
    FlakySeatStore flaky(100, 1);
    HoldManager mgr(catalog, flaky, clock, cfg);

    HoldResult r = mgr.hold_seats({"A1", "A2"}, kEvent, "s1");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kSeatUnavailable);
    EXPECT_EQ(r.blocked_seat_ids, std::vector<SeatId>{"A2"});
    EXPECT_EQ(flaky.acquire_calls, 4);

    // The A1 hold taken before the failure was rolled back.
    const std::vector<SeatHold> all = flaky.inner.all_holds();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].seat_id, "A1");
    EXPECT_EQ(all[0].status, HoldStatus::kCancelled);
    EXPECT_EQ(flaky.inner.seat_state(kEvent, "A1", clock.now()), SeatState::kAvailable);
}

// ---------- Concurrency tests ----------
TEST_F(HoldManagerTest, OnlyOneThreadCanHoldSameSeat) {
    constexpr int kThreads = 16;
    std::atomic<bool> start{false};
    std::atomic<int> successes{0};
    std::atomic<int> unavailable{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!start.load()) {
                // spin until start
            }
            HoldResult r = holds.hold_seats({"A1"}, kEvent, "session-" + std::to_string(i));
            if (r.success) {
                successes.fetch_add(1);
            } else if (r.error == ErrorCode::kSeatUnavailable) {
                unavailable.fetch_add(1);
            }
        });
    }

    start.store(true);
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(unavailable.load(), kThreads - 1);
    EXPECT_EQ(state("A1"), SeatState::kHeld);
}

TEST_F(HoldManagerTest, OverlappingBatchesNeverSplitSeats) {
    constexpr int kThreads = 12;
    std::atomic<bool> start{false};
    std::vector<HoldResult> results(kThreads);

    // Overlapping requests listed in opposite orders.
    const std::vector<SeatId> forward = {"A1", "A2", "A3", "A4"};
    const std::vector<SeatId> backward = {"A5", "A4", "A3", "A2"};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            while (!start.load()) {
            }
            results[i] = holds.hold_seats(i % 2 == 0 ? forward : backward, kEvent,
                                          "session-" + std::to_string(i));
        });
    }
    start.store(true);
    for (auto& t : threads) t.join();

    // Each seat has at most one open hold, and every winner owns its whole batch.
    std::map<SeatId, int> open_per_seat;
    for (const SeatHold& h : store.all_holds()) {
        if (is_open_status(h.status)) ++open_per_seat[h.seat_id];
    }
    for (const auto& kv : open_per_seat) {
        EXPECT_EQ(kv.second, 1) << kv.first;
    }

    int winners = 0;
    for (int i = 0; i < kThreads; ++i) {
        if (!results[i].success) continue;
        ++winners;
        for (const auto& id : results[i].batch.hold_ids) {
            EXPECT_TRUE(is_open_status(store.find_hold(id)->status));
        }
    }
    // Both requests contain A2..A4, so exactly one of them can win.
    EXPECT_EQ(winners, 1);
}
