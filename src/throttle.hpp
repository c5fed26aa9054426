#pragma once

#include "quota_tracker.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace playlist_sync {

/// Client-side rate-limit settings.
struct ThrottleConfig {
    /// Points allowed in the trailing minute before any delay is applied.
    int threshold         = 30;
    /// Points per minute at which the delay reaches maxWaitMs.
    int maxQuotaPerMinute = 90;
    /// Upper bound of a single admission delay.
    int maxWaitMs         = 1000;

    /// Capacity between threshold and the per-minute ceiling.
    int reserve() const { return maxQuotaPerMinute - threshold; }

    /// Defaults overridden by PLAYLIST_SYNC_THROTTLE_THRESHOLD and
    /// PLAYLIST_SYNC_MAX_QUOTA_PER_MINUTE.
    /// @throws std::invalid_argument if a variable is not an integer.
    static ThrottleConfig fromEnvironment();

    /// @throws std::invalid_argument on values the queue cannot work with.
    void validate() const;

    /// Soft problems worth reporting (e.g. reserve below 60 points, which
    /// lets saturation push admissions below one per second).
    std::vector<std::string> warnings() const;
};

/// Admission controller in front of every API call.
///
/// Decisions are taken one at a time in submission (FIFO) order: compute
/// the delay from the tracker's window, sleep, reserve the cost in the
/// tracker, then hand the turn to the next caller. The request itself runs
/// after the turn is released, so slow requests never hold up admission.
class ThrottleQueue {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// @param tracker  Ledger shared with nobody else; must outlive the queue.
    /// @param sleeper  Delay primitive; defaults to std::this_thread::sleep_for.
    explicit ThrottleQueue(QuotaTracker& tracker,
                           ThrottleConfig config = {},
                           Sleeper sleeper = {});

    ThrottleQueue(const ThrottleQueue&) = delete;
    ThrottleQueue& operator=(const ThrottleQueue&) = delete;

    /// Wait for admission of a call costing @p cost points, then invoke
    /// @p request. Its result or exception is passed through untouched.
    template <typename Request>
    auto execute(int cost, Request&& request) -> decltype(request()) {
        admit(cost);
        return std::forward<Request>(request)();
    }

    /// Delay (ms) a call of @p cost would get against the current window:
    /// 0 up to the threshold, then utilization^2 * maxWaitMs where
    /// utilization = (window + cost - threshold) / reserve, clamped to [0, 1].
    /// Reads the window inside an admission turn, so it queues behind
    /// callers already waiting and reserves nothing itself.
    int calculateWait(int cost);

    void setVerbose(bool v) { mVerbose = v; }

    // ---- accessors for summary report ----
    const ThrottleConfig& config()        const { return mConfig; }
    std::int64_t          totalWaitMs()   const { return mTotalWaitMs.load(); }
    int                   admittedCount() const { return mAdmitted.load(); }

    /// Callers holding or waiting for an admission turn.
    std::size_t pendingAdmissions() const;

private:
    QuotaTracker&  mTracker;
    ThrottleConfig mConfig;
    Sleeper        mSleeper;
    bool           mVerbose = false;

    // FIFO ticket lock guarding the decide + reserve section.
    mutable std::mutex      mMutex;
    std::condition_variable mTurnChanged;
    std::uint64_t           mNextTicket  = 0;
    std::uint64_t           mNowServing  = 0;

    std::atomic<std::int64_t> mTotalWaitMs{0};
    std::atomic<int>          mAdmitted{0};

    // Holds the admission turn for its lifetime. The turn passes on even
    // if the clock or the sleeper throws.
    class Turn {
    public:
        explicit Turn(ThrottleQueue& queue);
        ~Turn();

        Turn(const Turn&) = delete;
        Turn& operator=(const Turn&) = delete;

    private:
        ThrottleQueue& mQueue;
    };

    void admit(int cost);
    int  computeWait(int cost);
};

} // namespace playlist_sync
