#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace playlist_sync {

/// Sliding 60-second ledger of consumed quota points, bucketed by whole
/// second. Not synchronized: every mutation happens inside the
/// ThrottleQueue admission turn.
class QuotaTracker {
public:
    /// Returns the current time in whole seconds.
    using SecondClock = std::function<std::int64_t()>;

    static constexpr std::int64_t kWindowSeconds = 60;

    /// @param clock  Time source; defaults to the system clock.
    explicit QuotaTracker(SecondClock clock = {});

    /// Add @p points to the bucket of the current second.
    void record(int points);

    /// Sum of points recorded in the trailing window, i.e. buckets with
    /// timestamp > now - 60. Purges expired buckets as a side effect.
    int countWindow();

    /// Remove buckets with timestamp <= now - 60. Idempotent.
    void purgeExpired();

    // ---- introspection for tests ----
    void        clear() { mBuckets.clear(); }
    std::size_t size() const { return mBuckets.size(); }

private:
    SecondClock                       mClock;
    std::map<std::int64_t, int>       mBuckets;   // second -> points
};

} // namespace playlist_sync
