/// @file test_quota_tracker.cpp
/// Unit tests for quota_tracker.hpp — sliding 60-second quota ledger.

#include "quota_tracker.hpp"

#include <gtest/gtest.h>
#include <cstdint>

using namespace playlist_sync;

// ---------------------------------------------------------------------------
// Fixture with a hand-driven clock.
// ---------------------------------------------------------------------------

class QuotaTrackerTest : public ::testing::Test {
protected:
    std::int64_t now = 1'700'000'000;
    QuotaTracker tracker{[this] { return now; }};
};

// ============================================================================
// record / countWindow
// ============================================================================

TEST_F(QuotaTrackerTest, EmptyTrackerCountsZero) {
    EXPECT_EQ(tracker.countWindow(), 0);
    EXPECT_EQ(tracker.size(), 0u);
}

TEST_F(QuotaTrackerTest, SameSecondRecordsAggregateIntoOneBucket) {
    tracker.record(1);
    tracker.record(1);
    tracker.record(100);

    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_EQ(tracker.countWindow(), 102);
}

TEST_F(QuotaTrackerTest, RecordsAcrossSecondsAreSummed) {
    tracker.record(3);
    now += 10;
    tracker.record(4);
    now += 30;
    tracker.record(5);

    EXPECT_EQ(tracker.size(), 3u);
    EXPECT_EQ(tracker.countWindow(), 12);
}

TEST_F(QuotaTrackerTest, BucketAt59SecondsIsStillCounted) {
    tracker.record(7);
    now += 59;
    EXPECT_EQ(tracker.countWindow(), 7);
}

TEST_F(QuotaTrackerTest, BucketExactly60SecondsOldIsExcluded) {
    tracker.record(7);
    now += 60;
    EXPECT_EQ(tracker.countWindow(), 0);
}

TEST_F(QuotaTrackerTest, OnlyExpiredPointsDropOut) {
    tracker.record(10);        // t
    now += 30;
    tracker.record(20);        // t + 30
    now += 45;                 // t + 75: first bucket expired

    EXPECT_EQ(tracker.countWindow(), 20);
}

TEST_F(QuotaTrackerTest, CountWindowPurgesExpiredBuckets) {
    tracker.record(1);
    now += 1;
    tracker.record(1);
    now += 60;                 // both expired
    tracker.record(1);

    EXPECT_EQ(tracker.size(), 3u);
    EXPECT_EQ(tracker.countWindow(), 1);
    EXPECT_EQ(tracker.size(), 1u);
}

// ============================================================================
// purgeExpired / clear
// ============================================================================

TEST_F(QuotaTrackerTest, PurgeExpiredIsIdempotent) {
    tracker.record(2);
    now += 61;
    tracker.record(3);

    tracker.purgeExpired();
    EXPECT_EQ(tracker.size(), 1u);

    tracker.purgeExpired();
    EXPECT_EQ(tracker.size(), 1u);
    EXPECT_EQ(tracker.countWindow(), 3);
}

TEST_F(QuotaTrackerTest, PurgeKeepsLiveBuckets) {
    tracker.record(2);
    now += 5;
    tracker.purgeExpired();

    EXPECT_EQ(tracker.size(), 1u);
}

TEST_F(QuotaTrackerTest, ClearResetsEverything) {
    tracker.record(5);
    now += 1;
    tracker.record(5);
    tracker.clear();

    EXPECT_EQ(tracker.size(), 0u);
    EXPECT_EQ(tracker.countWindow(), 0);
}

TEST(QuotaTracker, SystemClockByDefault) {
    QuotaTracker tracker;
    tracker.record(3);
    EXPECT_EQ(tracker.countWindow(), 3);
}
