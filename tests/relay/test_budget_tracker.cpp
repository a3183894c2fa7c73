#include <gtest/gtest.h>
#include <relay/budget_tracker.hpp>

#include "relay/fake_provider.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace relay;

class BudgetTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 08:15:00 UTC on some day, well inside an hour window
        auto start = BudgetTracker::Clock::time_point(std::chrono::hours(473000) + std::chrono::minutes(15));
        clock_ = std::make_unique<test::ManualClock<BudgetTracker::Clock>>(start);

        BudgetConfig config;
        config.hourly_budget_usd = 100.0;
        tracker_ = std::make_unique<BudgetTracker>(config, clock_->fn());
    }

    void spend(double amount) {
        auto res = tracker_->try_reserve(amount);
        ASSERT_TRUE(res.ok());
        tracker_->commit(*res, amount);
    }

    std::unique_ptr<test::ManualClock<BudgetTracker::Clock>> clock_;
    std::unique_ptr<BudgetTracker> tracker_;
};

TEST_F(BudgetTrackerTest, ReserveWithinBudget) {
    auto res = tracker_->try_reserve(10.0);
    ASSERT_TRUE(res.ok());
    EXPECT_TRUE(res->active);
    EXPECT_DOUBLE_EQ(tracker_->reserved(), 10.0);
    EXPECT_DOUBLE_EQ(tracker_->spent(), 0.0);
}

TEST_F(BudgetTrackerTest, RejectsWhenEstimateWouldExceedCeiling) {
    spend(99.0);

    auto res = tracker_->try_reserve(2.0);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error_code(), ErrorCode::COST_BUDGET_EXCEEDED);
    // The rejected request leaves no trace
    EXPECT_DOUBLE_EQ(tracker_->spent(), 99.0);
    EXPECT_DOUBLE_EQ(tracker_->reserved(), 0.0);
}

TEST_F(BudgetTrackerTest, ExactlyReachingCeilingIsAllowed) {
    spend(99.0);
    EXPECT_TRUE(tracker_->try_reserve(1.0).ok());
}

TEST_F(BudgetTrackerTest, OutstandingReservationsCount) {
    auto first = tracker_->try_reserve(60.0);
    ASSERT_TRUE(first.ok());

    EXPECT_FALSE(tracker_->try_reserve(50.0).ok());

    tracker_->release(*first);
    EXPECT_TRUE(tracker_->try_reserve(50.0).ok());
}

TEST_F(BudgetTrackerTest, OvershootIsRecordedAndNextRequestRejected) {
    auto res = tracker_->try_reserve(5.0);
    ASSERT_TRUE(res.ok());
    tracker_->commit(*res, 120.0);

    EXPECT_DOUBLE_EQ(tracker_->spent(), 120.0);
    EXPECT_LT(*tracker_->remaining(), 0.0);
    EXPECT_FALSE(tracker_->try_reserve(0.01).ok());
}

TEST_F(BudgetTrackerTest, CommitAndReleaseAreIdempotent) {
    auto res = tracker_->try_reserve(10.0);
    ASSERT_TRUE(res.ok());

    tracker_->commit(*res, 8.0);
    tracker_->commit(*res, 8.0);
    tracker_->release(*res);

    EXPECT_FALSE(res->active);
    EXPECT_DOUBLE_EQ(tracker_->spent(), 8.0);
    EXPECT_DOUBLE_EQ(tracker_->reserved(), 0.0);
}

TEST_F(BudgetTrackerTest, ResetsOnHourBoundary) {
    spend(99.0);
    EXPECT_FALSE(tracker_->try_reserve(2.0).ok());

    clock_->advance(std::chrono::minutes(44));  // 08:59
    EXPECT_FALSE(tracker_->try_reserve(2.0).ok());

    clock_->advance(std::chrono::minutes(1));   // 09:00
    EXPECT_DOUBLE_EQ(tracker_->spent(), 0.0);
    EXPECT_TRUE(tracker_->try_reserve(2.0).ok());
}

TEST_F(BudgetTrackerTest, ReservationFromPreviousWindowCommitsIntoCurrent) {
    auto res = tracker_->try_reserve(10.0);
    ASSERT_TRUE(res.ok());

    clock_->advance(std::chrono::hours(1));
    tracker_->commit(*res, 7.0);

    EXPECT_DOUBLE_EQ(tracker_->spent(), 7.0);
    EXPECT_DOUBLE_EQ(tracker_->reserved(), 0.0);
}

TEST_F(BudgetTrackerTest, UnlimitedWithoutCeiling) {
    BudgetTracker unlimited(BudgetConfig{}, clock_->fn());
    EXPECT_FALSE(unlimited.limited());
    EXPECT_FALSE(unlimited.remaining().has_value());

    auto res = unlimited.try_reserve(1e9);
    ASSERT_TRUE(res.ok());
    unlimited.commit(*res, 1e9);
    EXPECT_TRUE(unlimited.try_reserve(1e9).ok());
}

TEST_F(BudgetTrackerTest, ConcurrentReservationsNeverOversubscribe) {
    std::atomic<int> granted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            for (int j = 0; j < 50; ++j) {
                if (tracker_->try_reserve(1.0).ok()) {
                    granted.fetch_add(1);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(granted.load(), 100);
    EXPECT_DOUBLE_EQ(tracker_->reserved(), 100.0);
}
