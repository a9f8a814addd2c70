#pragma once

#include <chrono>
#include <mutex>
#include <optional>

namespace wfmk {

/// Spaces outbound requests so that no two grants are closer than
/// 60 / requestsPerMinute seconds. One instance per invocation, shared by
/// reference with every fetch path.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    /// @throws ConfigError if @p requestsPerMinute is not positive.
    explicit RateLimiter(int requestsPerMinute, bool verbose = false);

    RateLimiter(const RateLimiter&)            = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Block until the caller may issue one request. Thread-safe; concurrent
    /// callers are granted one at a time, each a full interval apart.
    void acquire();

    Clock::duration interval() const { return mInterval; }

    // ---- accessors for summary report ----
    int    totalGrants()       const;
    double totalSleepSeconds() const;

private:
    Clock::duration                  mInterval;
    bool                             mVerbose;

    mutable std::mutex               mMutex;
    std::optional<Clock::time_point> mLastGrant;
    int                              mGrantCount = 0;
    Clock::duration                  mTotalSleep{0};
};

} // namespace wfmk
