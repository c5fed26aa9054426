#include "quota_tracker.hpp"

#include <chrono>
#include <utility>

namespace playlist_sync {

namespace {

std::int64_t systemSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

QuotaTracker::QuotaTracker(SecondClock clock)
    : mClock(clock ? std::move(clock) : SecondClock(systemSeconds)) {}

void QuotaTracker::record(int points) {
    mBuckets[mClock()] += points;
}

int QuotaTracker::countWindow() {
    const std::int64_t cutoff = mClock() - kWindowSeconds;

    int total = 0;
    for (auto it = mBuckets.upper_bound(cutoff); it != mBuckets.end(); ++it) {
        total += it->second;
    }

    // Opportunistic cleanup.
    mBuckets.erase(mBuckets.begin(), mBuckets.upper_bound(cutoff));
    return total;
}

void QuotaTracker::purgeExpired() {
    const std::int64_t cutoff = mClock() - kWindowSeconds;
    mBuckets.erase(mBuckets.begin(), mBuckets.upper_bound(cutoff));
}

} // namespace playlist_sync
