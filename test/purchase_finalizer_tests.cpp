#include <gtest/gtest.h>

#include "expiry_sweeper.hpp"
#include "test_support.hpp"

using namespace seating;
using seating_test::EngineTest;

using PurchaseFinalizerTest = EngineTest;

TEST_F(PurchaseFinalizerTest, CompletesLiveHolds) {
    ASSERT_TRUE(hold({"A2", "A1"}, "s1").success);

    CustomerInfo buyer{"buyer@example.com", "Ada", "card"};
    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", buyer);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.seat_ids, (std::vector<SeatId>{"A1", "A2"}));
    EXPECT_TRUE(r.expired_seat_ids.empty());

    EXPECT_EQ(state("A1"), SeatState::kSold);
    EXPECT_EQ(state("A2"), SeatState::kSold);
    for (const SeatHold& h : store.holds_for_session("s1", kEvent)) {
        EXPECT_EQ(h.status, HoldStatus::kCompleted);
    }
    expect_no_sold_and_held();
}

TEST_F(PurchaseFinalizerTest, SecondPurchaseFindsNoHolds) {
    ASSERT_TRUE(hold({"A1"}, "s1").success);
    ASSERT_TRUE(finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{}).success);

    FinalizeResult again = finalizer.complete_purchase("s1", kEvent, "order-2", CustomerInfo{});
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.error, ErrorCode::kHoldNotFound);
    EXPECT_EQ(store.sold_seats(kEvent).size(), 1u);
}

TEST_F(PurchaseFinalizerTest, SoldSeatStaysSold) {
    ASSERT_TRUE(hold({"A1"}, "s1").success);
    ASSERT_TRUE(finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{}).success);

    EXPECT_EQ(hold({"A1"}, "s2").error, ErrorCode::kSeatUnavailable);
    HoldFilter f;
    f.event_id = kEvent;
    EXPECT_EQ(holds.release_holds(f).released, 0u);
    EXPECT_EQ(state("A1"), SeatState::kSold);
}

// ---------- Tests: partial expiry ----------
TEST_F(PurchaseFinalizerTest, PartialExpiryRejectsWholePurchase) {
    HoldResult batch = hold({"A1", "A2", "A3", "A4"}, "s1", 1);
    ASSERT_TRUE(batch.success);
    // hold_ids follow the sorted seat order: A1, A2, A3, A4.
    ASSERT_TRUE(holds.extend_hold(batch.batch.hold_ids[0], 10).success);
    ASSERT_TRUE(holds.extend_hold(batch.batch.hold_ids[2], 10).success);
    ASSERT_TRUE(holds.extend_hold(batch.batch.hold_ids[3], 10).success);

    clock.set(batch.batch.expires_at + std::chrono::milliseconds(1));

    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, std::vector<SeatId>{"A2"});
    EXPECT_TRUE(store.sold_seats(kEvent).empty());
    EXPECT_EQ(state("A1"), SeatState::kHeld);
    EXPECT_EQ(state("A2"), SeatState::kAvailable);

    // Same answer once the sweeper has closed the lapsed hold.
    ExpirySweeper sweeper(store, clock);
    EXPECT_EQ(sweeper.sweep_once(), 1u);
    r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, std::vector<SeatId>{"A2"});

    // Re-holding the listed seat unblocks the purchase.
    ASSERT_TRUE(hold({"A2"}, "s1").success);
    r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.seat_ids, (std::vector<SeatId>{"A1", "A2", "A3", "A4"}));
    expect_no_sold_and_held();
}

TEST_F(PurchaseFinalizerTest, AllHoldsExpired) {
    ASSERT_TRUE(hold({"A1", "A2"}, "s1", 1).success);
    clock.advance(std::chrono::minutes(2));

    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, (std::vector<SeatId>{"A1", "A2"}));
}

TEST_F(PurchaseFinalizerTest, OnlyMostRecentBatchIsReportedWhenNothingIsLive) {
    ASSERT_TRUE(hold({"A1"}, "s1", 1).success);
    clock.advance(std::chrono::minutes(1));
    ASSERT_TRUE(hold({"B1", "B2"}, "s1", 1).success);
    clock.advance(std::chrono::minutes(5));

    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, (std::vector<SeatId>{"B1", "B2"}));
}

TEST_F(PurchaseFinalizerTest, LapsedHoldFromAnotherCallBlocksPurchase) {
    ASSERT_TRUE(hold({"A2"}, "s1", 1).success);
    ASSERT_TRUE(hold({"A1"}, "s1").success);
    ASSERT_TRUE(hold({"A3"}, "s1").success);
    clock.advance(std::chrono::seconds(61));

    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, std::vector<SeatId>{"A2"});
    EXPECT_TRUE(store.sold_seats(kEvent).empty());
    EXPECT_EQ(state("A1"), SeatState::kHeld);
    EXPECT_EQ(state("A3"), SeatState::kHeld);

    // Still blocked after the sweeper has closed it.
    ExpirySweeper sweeper(store, clock);
    EXPECT_EQ(sweeper.sweep_once(), 1u);
    r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_EQ(r.error, ErrorCode::kPartialExpiry);
    EXPECT_EQ(r.expired_seat_ids, std::vector<SeatId>{"A2"});
}

TEST_F(PurchaseFinalizerTest, HoldAbandonedBeforeCheckoutDoesNotBlock) {
    ASSERT_TRUE(hold({"A1"}, "s1", 1).success);
    clock.advance(std::chrono::minutes(2));
    ASSERT_TRUE(hold({"B1"}, "s1").success);

    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.seat_ids, std::vector<SeatId>{"B1"});
    EXPECT_EQ(state("A1"), SeatState::kAvailable);
}

// ---------- Tests: other failures ----------
TEST_F(PurchaseFinalizerTest, ReleasedHoldsAreIgnored) {
    HoldResult a = hold({"A1"}, "s1");
    ASSERT_TRUE(a.success);
    HoldFilter f;
    f.hold_ids = a.batch.hold_ids;
    ASSERT_EQ(holds.release_holds(f).released, 1u);

    FinalizeResult none = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    EXPECT_EQ(none.error, ErrorCode::kHoldNotFound);

    ASSERT_TRUE(hold({"A2"}, "s1").success);
    FinalizeResult r = finalizer.complete_purchase("s1", kEvent, "order-1", CustomerInfo{});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.seat_ids, std::vector<SeatId>{"A2"});
    EXPECT_EQ(state("A1"), SeatState::kAvailable);
}

TEST_F(PurchaseFinalizerTest, OtherSessionsHoldsAreNotPurchased) {
    ASSERT_TRUE(hold({"A1"}, "s1").success);
    ASSERT_TRUE(hold({"A2"}, "s2").success);

    FinalizeResult r = finalizer.complete_purchase("s2", kEvent, "order-2", CustomerInfo{});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.seat_ids, std::vector<SeatId>{"A2"});
    EXPECT_EQ(state("A1"), SeatState::kHeld);
}

TEST_F(PurchaseFinalizerTest, RejectsEmptyIdentifiers) {
    EXPECT_EQ(finalizer.complete_purchase("", kEvent, "o", CustomerInfo{}).error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(finalizer.complete_purchase("s1", "", "o", CustomerInfo{}).error, ErrorCode::kInvalidRequest);
    EXPECT_EQ(finalizer.complete_purchase("s1", kEvent, "", CustomerInfo{}).error, ErrorCode::kInvalidRequest);
}
