#include "cache_store.hpp"
#include "config.hpp"
#include "fetcher.hpp"
#include "http_client.hpp"
#include "matcher.hpp"
#include "rate_limiter.hpp"
#include "report.hpp"
#include "resolver.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kTopOrders    = 5;
constexpr std::size_t kFetchWorkers = 4;

std::vector<std::string> collectPatterns(const wfmk::Config& cfg) {
    std::vector<std::string> patterns = cfg.items;
    for (const auto& file : cfg.files) {
        for (auto& line : wfmk::readLines(file)) {
            if (std::find(patterns.begin(), patterns.end(), line) == patterns.end()) {
                patterns.push_back(std::move(line));
            }
        }
    }
    return patterns;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        const wfmk::Config cfg = wfmk::parseArgs(argc, argv);
        if (cfg.showHelp) {
            wfmk::printUsage(std::cout);
            return 0;
        }

        const bool verboseRequests = cfg.verbosity & wfmk::kVerboseRequests;
        if (verboseRequests) {
            std::cerr << "Cache dir: " << cfg.cacheDir.string() << "\n";
        }

        // Configuration errors surface here, before any request is made.
        wfmk::RateLimiter limiter(cfg.rateLimit, verboseRequests);
        wfmk::HttpClient  client(cfg.baseUrl, cfg.timeoutMs);
        client.setVerbose(verboseRequests);
        wfmk::MarketFetcher fetcher(client, verboseRequests);

        if (cfg.action == wfmk::Action::ClearCache) {
            if (cfg.verbosity & wfmk::kVerboseProgress) {
                std::cerr << "Clearing cache dir " << cfg.cacheDir << "\n";
            }
            // Clears the on-disk cache even when --no-cache is given.
            wfmk::DiskCacheStore store(cfg.cacheDir, verboseRequests);
            wfmk::Resolver resolver(store, limiter, fetcher, cfg.verbosity);
            if (auto err = resolver.clearCache()) {
                std::cerr << "Error: " << err->message() << "\n";
                return 1;
            }
            return 0;
        }

        std::unique_ptr<wfmk::CacheStore> cache;
        if (cfg.cacheEnabled) {
            cache = std::make_unique<wfmk::DiskCacheStore>(cfg.cacheDir, verboseRequests);
        } else {
            cache = std::make_unique<wfmk::NullCacheStore>();
        }

        wfmk::Resolver resolver(*cache, limiter, fetcher, cfg.verbosity);

        const auto patterns = collectPatterns(cfg);

        auto catalog = resolver.resolveCatalog(cfg.platform, cfg.language, cfg.ttlItems);
        if (!catalog) {
            std::cerr << "Error: " << catalog.error().message() << "\n";
            return 1;
        }

        int retval = 0;

        const auto matches = wfmk::matchPatterns(catalog.value(), patterns);
        for (const auto& pattern : matches.unmatched) {
            retval = 1;
            if (cfg.action != wfmk::Action::List) {
                std::cerr << "Error: '" << pattern << "' not found\n";
            }
        }

        if (cfg.action == wfmk::Action::List) {
            auto names = matches.names;
            std::sort(names.begin(), names.end());
            if (cfg.reverse) {
                std::reverse(names.begin(), names.end());
            }
            for (const auto& name : names) {
                std::cout << name << "\n";
            }
            return retval;
        }

        std::map<std::string, std::string> urlNames;
        for (const auto& item : catalog.value()) {
            urlNames.emplace(item.name, item.urlName);
        }

        std::vector<std::string> toFetch;
        toFetch.reserve(matches.names.size());
        for (const auto& name : matches.names) {
            toFetch.push_back(urlNames.at(name));
        }

        const auto results = resolver.resolveOrdersBatch(
            toFetch, cfg.platform, cfg.language, cfg.ttlOrders, kFetchWorkers);

        const wfmk::OrderFilter filter{cfg.buyers, wfmk::toString(cfg.platform), cfg.language};
        const std::size_t limit = cfg.showAll ? std::numeric_limits<std::size_t>::max()
                                              : kTopOrders;

        std::vector<wfmk::PriceSummary> summaryRows;
        for (std::size_t i = 0; i < results.size(); ++i) {
            const auto& name = matches.names[i];
            if (!results[i]) {
                std::cerr << "Error: " << results[i].error().message() << "\n";
                retval = 1;
                continue;
            }

            auto orders = wfmk::filterOrders(results[i].value(), filter);
            wfmk::sortByPrice(orders, cfg.buyers, cfg.reverse);

            if (cfg.action == wfmk::Action::Summary) {
                summaryRows.push_back(wfmk::summarize(name, orders));
            } else {
                wfmk::printOrdersTable(std::cout, name, orders, cfg.buyers, limit);
            }
        }

        if (cfg.action == wfmk::Action::Summary) {
            wfmk::printSummaryTable(std::cout, std::move(summaryRows));
        }

        if (verboseRequests) {
            const auto stats = resolver.getStats();
            std::cerr
                << "[Resolver] cache hits: "   << stats.cacheHits
                << ", misses: "                << stats.cacheMisses
                << ", fetches: "               << stats.fetches
                << ", failures: "              << stats.failures
                << ", rate-limit sleep (s): "  << limiter.totalSleepSeconds()
                << "\n";
        }

        return retval;

    } catch (const wfmk::ConfigError& e) {
        std::cerr << "wfmk: error: " << e.what() << "\n"
                  << "Try 'wfmk --help' for more information.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
