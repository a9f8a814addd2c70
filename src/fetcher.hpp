#pragma once

#include "errors.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace wfmk {

/// Decoded `payload` object of one API response, or the reason there is none.
using FetchResult = Result<nlohmann::json>;

/// Pure I/O boundary: one call, one request. No caching, pacing or retries.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual FetchResult fetch(const FetchRequest& request) = 0;

    FetchResult fetchCatalog(Platform platform, const std::string& language);
    FetchResult fetchOrders(const std::string& urlName,
                            Platform platform,
                            const std::string& language);
};

/// Fetcher for the warframe.market v1 REST API.
class MarketFetcher : public Fetcher {
public:
    static constexpr const char* kDefaultBaseUrl = "https://api.warframe.market";

    explicit MarketFetcher(const HttpClient& client, bool verbose = false);

    FetchResult fetch(const FetchRequest& request) override;

    /// Request path for @p request, e.g. "/v1/items/ash_prime_set/orders".
    static std::string targetFor(const FetchRequest& request);

private:
    const HttpClient& mClient;
    bool              mVerbose;
};

} // namespace wfmk
