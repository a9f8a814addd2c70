#pragma once

#include "cache_store.hpp"
#include "errors.hpp"
#include "fetcher.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wfmk {

/// Verbosity bits understood by the resolver.
enum Verbosity : int {
    kVerboseProgress = 1,   // "Loading ... from cache" / "Fetching ..."
    kVerboseRequests = 2,   // URLs, limiter delays, cache writes
    kVerboseCatalog  = 4,   // dump the catalog payload
    kVerboseOrders   = 8,   // dump each orders payload
};

/// Entry point of the access layer: serves fresh cache entries and falls
/// through to the rate-limited Fetcher otherwise.
///
/// A stale entry is never returned when its refetch fails; the failure is.
class Resolver {
public:
    struct Stats {
        int cacheHits   = 0;
        int cacheMisses = 0;
        int fetches     = 0;
        int failures    = 0;
    };

    using NowFn = std::function<TimePoint()>;

    Resolver(CacheStore& cache,
             RateLimiter& limiter,
             Fetcher& fetcher,
             int verbosity = 0,
             NowFn now = &Clock::now);

    /// Catalog for one platform/language, sorted by item name.
    Result<ItemList> resolveCatalog(Platform platform,
                                    const std::string& language,
                                    std::chrono::seconds ttl);

    /// Open orders for one item, in arrival order.
    Result<OrderList> resolveOrders(const std::string& urlName,
                                    Platform platform,
                                    const std::string& language,
                                    std::chrono::seconds ttl);

    /// Orders for several items, fetched by up to @p maxConcurrency workers.
    /// results[i] always belongs to urlNames[i].
    std::vector<Result<OrderList>> resolveOrdersBatch(
        const std::vector<std::string>& urlNames,
        Platform platform,
        const std::string& language,
        std::chrono::seconds ttl,
        std::size_t maxConcurrency = 4);

    /// Wipe the cache. Returns the failure, if any.
    std::optional<Error> clearCache();

    Stats getStats() const;

private:
    CacheStore&  mCache;
    RateLimiter& mLimiter;
    Fetcher&     mFetcher;
    int          mVerbosity;
    NowFn        mNow;

    std::atomic<int> mCacheHits{0};
    std::atomic<int> mCacheMisses{0};
    std::atomic<int> mFetches{0};
    std::atomic<int> mFailures{0};

    template <typename T, typename Decoder>
    Result<T> resolve(const FetchRequest& request,
                      std::chrono::seconds ttl,
                      Decoder decode,
                      int dumpFlag);
};

} // namespace wfmk
