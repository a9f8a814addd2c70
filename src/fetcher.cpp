#include "fetcher.hpp"
#include "mapping.hpp"

#include <iostream>
#include <stdexcept>

namespace wfmk {

namespace {
constexpr std::size_t kBodyPreviewLength = 200;
} // namespace

FetchResult Fetcher::fetchCatalog(Platform platform, const std::string& language) {
    return fetch(FetchRequest{FetchRequest::Kind::Catalog, "", platform, language});
}

FetchResult Fetcher::fetchOrders(const std::string& urlName,
                                 Platform platform,
                                 const std::string& language) {
    return fetch(FetchRequest{FetchRequest::Kind::Orders, urlName, platform, language});
}

MarketFetcher::MarketFetcher(const HttpClient& client, bool verbose)
    : mClient(client)
    , mVerbose(verbose) {}

std::string MarketFetcher::targetFor(const FetchRequest& request) {
    if (request.kind == FetchRequest::Kind::Catalog) {
        return "/v1/items";
    }
    return "/v1/items/" + request.urlName + "/orders";
}

FetchResult MarketFetcher::fetch(const FetchRequest& request) {
    const HttpClient::Headers headers = {
        {"Platform", toString(request.platform)},
        {"Language", request.language},
    };

    HttpClient::Response resp;
    try {
        resp = mClient.get(targetFor(request), headers);
    } catch (const TransportError& e) {
        return FetchResult::failure(
            Error{e.kind(), request.describe() + ": " + e.what()});
    } catch (const std::exception& e) {
        // TLS setup and similar failures outside the exchange itself.
        return FetchResult::failure(
            Error{ErrorKind::NetworkUnreachable, request.describe() + ": " + e.what()});
    }

    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        std::string preview = resp.body.substr(0, kBodyPreviewLength);
        if (mVerbose && !preview.empty()) {
            std::cerr << "[Fetcher] HTTP " << resp.httpStatus << " body: "
                      << preview << "\n";
        }
        return FetchResult::failure(
            Error{ErrorKind::HttpStatus, request.describe(), resp.httpStatus});
    }

    auto body = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (body.is_discarded()) {
        return FetchResult::failure(
            Error{ErrorKind::MalformedResponse,
                  request.describe() + ": response is not valid JSON"});
    }

    try {
        return FetchResult::success(extractPayload(body));
    } catch (const std::runtime_error& e) {
        return FetchResult::failure(
            Error{ErrorKind::MalformedResponse,
                  request.describe() + ": " + e.what()});
    }
}

} // namespace wfmk
