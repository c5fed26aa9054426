#include "throttle.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace playlist_sync {

namespace {

constexpr int kMinimumReserve = 60;

int envInt(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return fallback;

    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(raw, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || raw[consumed] != '\0') {
        throw std::invalid_argument(std::string(name) +
                                    " is not an integer: " + raw);
    }
    return value;
}

void defaultSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

} // namespace

// ---------------------------------------------------------------------------
// ThrottleConfig
// ---------------------------------------------------------------------------

ThrottleConfig ThrottleConfig::fromEnvironment() {
    ThrottleConfig cfg;
    cfg.threshold = envInt("PLAYLIST_SYNC_THROTTLE_THRESHOLD", cfg.threshold);
    cfg.maxQuotaPerMinute =
        envInt("PLAYLIST_SYNC_MAX_QUOTA_PER_MINUTE", cfg.maxQuotaPerMinute);
    return cfg;
}

void ThrottleConfig::validate() const {
    if (threshold < 0) {
        throw std::invalid_argument("throttle threshold must be >= 0");
    }
    if (maxQuotaPerMinute <= 0) {
        throw std::invalid_argument("max quota per minute must be > 0");
    }
    if (maxWaitMs <= 0) {
        throw std::invalid_argument("max wait must be > 0 ms");
    }
}

std::vector<std::string> ThrottleConfig::warnings() const {
    std::vector<std::string> out;
    if (reserve() < kMinimumReserve) {
        out.push_back("reserve quota (" + std::to_string(reserve()) +
                      ") is less than " + std::to_string(kMinimumReserve) +
                      "; delays may exceed " + std::to_string(maxWaitMs) +
                      " ms per request. Increase max quota per minute or "
                      "decrease the threshold.");
    }
    return out;
}

// ---------------------------------------------------------------------------
// ThrottleQueue
// ---------------------------------------------------------------------------

ThrottleQueue::ThrottleQueue(QuotaTracker& tracker,
                             ThrottleConfig config,
                             Sleeper sleeper)
    : mTracker(tracker)
    , mConfig(config)
    , mSleeper(sleeper ? std::move(sleeper) : Sleeper(defaultSleep))
{
    mConfig.validate();
    for (const auto& warning : mConfig.warnings()) {
        std::cerr << "[Throttle Config] Warning: " << warning << "\n";
    }
}

ThrottleQueue::Turn::Turn(ThrottleQueue& queue) : mQueue(queue) {
    std::unique_lock<std::mutex> lock(mQueue.mMutex);
    const std::uint64_t ticket = mQueue.mNextTicket++;
    mQueue.mTurnChanged.wait(lock, [&] { return mQueue.mNowServing == ticket; });
}

ThrottleQueue::Turn::~Turn() {
    {
        std::lock_guard<std::mutex> guard(mQueue.mMutex);
        ++mQueue.mNowServing;
    }
    mQueue.mTurnChanged.notify_all();
}

int ThrottleQueue::calculateWait(int cost) {
    Turn turn(*this);
    return computeWait(cost);
}

int ThrottleQueue::computeWait(int cost) {
    const int afterRequest = mTracker.countWindow() + cost;
    if (afterRequest <= mConfig.threshold) return 0;

    // A non-positive reserve means any overage is full saturation.
    double utilization = 1.0;
    if (mConfig.reserve() > 0) {
        utilization = static_cast<double>(afterRequest - mConfig.threshold) /
                      mConfig.reserve();
        utilization = std::clamp(utilization, 0.0, 1.0);
    }

    const auto waitMs = static_cast<int>(
        std::lround(utilization * utilization * mConfig.maxWaitMs));
    return std::min(mConfig.maxWaitMs, waitMs);
}

std::size_t ThrottleQueue::pendingAdmissions() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return static_cast<std::size_t>(mNextTicket - mNowServing);
}

void ThrottleQueue::admit(int cost) {
    Turn turn(*this);

    const int waitMs = computeWait(cost);
    if (waitMs > 0) {
        if (mVerbose) {
            std::cerr << "[Throttle] Quota window near limit: waiting "
                      << waitMs << " ms before request costing " << cost
                      << " point(s)\n";
        }
        mTotalWaitMs += waitMs;
        mSleeper(std::chrono::milliseconds(waitMs));
    }

    // Reserve before dispatch so the next decision already sees it.
    mTracker.record(cost);
    ++mAdmitted;
}

} // namespace playlist_sync
