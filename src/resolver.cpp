#include "resolver.hpp"
#include "mapping.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

namespace wfmk {

Resolver::Resolver(CacheStore& cache,
                   RateLimiter& limiter,
                   Fetcher& fetcher,
                   int verbosity,
                   NowFn now)
    : mCache(cache)
    , mLimiter(limiter)
    , mFetcher(fetcher)
    , mVerbosity(verbosity)
    , mNow(std::move(now)) {}

// ---------------------------------------------------------------------------
// Public: single resources
// ---------------------------------------------------------------------------

Result<ItemList> Resolver::resolveCatalog(Platform platform,
                                          const std::string& language,
                                          std::chrono::seconds ttl)
{
    const FetchRequest request{FetchRequest::Kind::Catalog, "", platform, language};

    auto decode = [](const nlohmann::json& payload) {
        ItemList items = parseItems(payload);
        // Sorted once here so callers never have to sort matches.
        std::stable_sort(items.begin(), items.end(),
                         [](const Item& a, const Item& b) { return a.name < b.name; });
        return items;
    };
    return resolve<ItemList>(request, ttl, decode, kVerboseCatalog);
}

Result<OrderList> Resolver::resolveOrders(const std::string& urlName,
                                          Platform platform,
                                          const std::string& language,
                                          std::chrono::seconds ttl)
{
    const FetchRequest request{FetchRequest::Kind::Orders, urlName, platform, language};

    auto decode = [](const nlohmann::json& payload) { return parseOrders(payload); };
    return resolve<OrderList>(request, ttl, decode, kVerboseOrders);
}

// ---------------------------------------------------------------------------
// Public: batch fan-out
// ---------------------------------------------------------------------------

std::vector<Result<OrderList>> Resolver::resolveOrdersBatch(
    const std::vector<std::string>& urlNames,
    Platform platform,
    const std::string& language,
    std::chrono::seconds ttl,
    std::size_t maxConcurrency)
{
    std::vector<std::optional<Result<OrderList>>> slots(urlNames.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (std::size_t i = next++; i < urlNames.size(); i = next++) {
            slots[i] = resolveOrders(urlNames[i], platform, language, ttl);
        }
    };

    const std::size_t workers =
        std::min(std::max<std::size_t>(maxConcurrency, 1), urlNames.size());

    std::vector<std::future<void>> running;
    running.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        running.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : running) {
        f.get();
    }

    std::vector<Result<OrderList>> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

std::optional<Error> Resolver::clearCache() {
    try {
        mCache.clear();
    } catch (const std::exception& e) {
        return Error{ErrorKind::CacheIo, e.what()};
    }
    return std::nullopt;
}

Resolver::Stats Resolver::getStats() const {
    Stats stats;
    stats.cacheHits   = mCacheHits.load();
    stats.cacheMisses = mCacheMisses.load();
    stats.fetches     = mFetches.load();
    stats.failures    = mFailures.load();
    return stats;
}

// ---------------------------------------------------------------------------
// Private: cache -> limiter -> fetcher
// ---------------------------------------------------------------------------

template <typename T, typename Decoder>
Result<T> Resolver::resolve(const FetchRequest& request,
                            std::chrono::seconds ttl,
                            Decoder decode,
                            int dumpFlag)
{
    const auto key = request.cacheKey();

    if (auto entry = mCache.get(key); entry && isFresh(*entry, ttl, mNow())) {
        auto payload = nlohmann::json::parse(entry->payload, nullptr,
                                             /*allow_exceptions=*/false);
        try {
            if (payload.is_discarded()) {
                throw std::runtime_error("not valid JSON");
            }
            T value = decode(payload);

            ++mCacheHits;
            if (mVerbosity & kVerboseProgress) {
                std::cerr << "[Resolver] Loading " << request.describe()
                          << " from cache\n";
            }
            if (mVerbosity & dumpFlag) {
                std::cerr << payload.dump(4) << "\n";
            }
            return Result<T>::success(std::move(value));
        } catch (const std::exception& e) {
            // Treat as a miss and overwrite it below.
            std::cerr << "[Resolver] Warning: discarding cached "
                      << request.describe() << ": " << e.what() << "\n";
        }
    }

    ++mCacheMisses;
    if (mVerbosity & kVerboseProgress) {
        std::cerr << "[Resolver] Fetching " << request.describe() << "\n";
    }

    mLimiter.acquire();
    ++mFetches;

    auto fetched = mFetcher.fetch(request);
    if (!fetched.ok()) {
        ++mFailures;
        return Result<T>::failure(fetched.error());
    }

    std::optional<T> value;
    try {
        value = decode(fetched.value());
    } catch (const std::exception& e) {
        ++mFailures;
        return Result<T>::failure(Error{ErrorKind::MalformedResponse,
                                        request.describe() + ": " + e.what()});
    }

    if (mVerbosity & dumpFlag) {
        std::cerr << fetched.value().dump(4) << "\n";
    }

    // Only fully decoded payloads reach the cache.
    mCache.put(key, fetched.value().dump(), mNow());

    return Result<T>::success(std::move(*value));
}

} // namespace wfmk
