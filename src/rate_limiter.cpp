#include "rate_limiter.hpp"
#include "errors.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <thread>

namespace wfmk {

RateLimiter::RateLimiter(int requestsPerMinute, bool verbose)
    : mInterval(std::chrono::seconds(60))
    , mVerbose(verbose)
{
    if (requestsPerMinute <= 0) {
        throw ConfigError("rate limit must be a positive number of requests "
                          "per minute, got " + std::to_string(requestsPerMinute));
    }
    mInterval = std::chrono::duration_cast<Clock::duration>(
                    std::chrono::seconds(60)) / requestsPerMinute;
}

void RateLimiter::acquire() {
    Clock::time_point grant;
    {
        // Reserve the next slot under the lock, then sleep outside it so
        // later callers can queue up behind this one.
        std::lock_guard<std::mutex> lock(mMutex);
        const auto now = Clock::now();
        grant = mLastGrant ? std::max(now, *mLastGrant + mInterval) : now;
        mLastGrant = grant;
        ++mGrantCount;
        mTotalSleep += grant - now;
    }

    const auto wait = grant - Clock::now();
    if (wait <= Clock::duration::zero()) {
        return;
    }

    if (mVerbose) {
        std::cerr << "[RateLimiter] Delaying request for "
                  << std::chrono::duration<double, std::milli>(wait).count()
                  << " ms\n";
    }
    std::this_thread::sleep_until(grant);
}

int RateLimiter::totalGrants() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mGrantCount;
}

double RateLimiter::totalSleepSeconds() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return std::chrono::duration<double>(mTotalSleep).count();
}

} // namespace wfmk
