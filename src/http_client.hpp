#pragma once

#include "errors.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace wfmk {

/// Transport-level failure (resolve/connect/io or deadline expiry).
class TransportError : public std::runtime_error {
public:
    TransportError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), mKind(kind) {}

    ErrorKind kind() const { return mKind; }

private:
    ErrorKind mKind;
};

/// Low-level HTTP GET client built on Boost.Beast.
/// Every call opens its own connection and io_context, so one instance may
/// be used from several threads at once.
class HttpClient {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    using Headers = std::vector<std::pair<std::string, std::string>>;

    static constexpr std::uint64_t kDefaultBodyLimit = 64ull * 1024 * 1024;

    /// @param baseUrl    Scheme and authority, e.g. "https://api.warframe.market"
    /// @param timeoutMs  Deadline for connect, TLS handshake, write and read.
    ///                   Name resolution stops waiting at the same deadline,
    ///                   but a stalled getaddrinfo can still delay the return.
    explicit HttpClient(const std::string& baseUrl, int timeoutMs = 15000);
    virtual ~HttpClient() = default;

    /// GET @p target (path + query) relative to the base URL.
    /// @throws TransportError with ErrorKind::Timeout, NetworkUnreachable, or
    ///         MalformedResponse when the body exceeds the body limit.
    virtual Response get(const std::string& target, const Headers& headers = {}) const;

    void setVerbose(bool v) { mVerbose = v; }

    /// Largest accepted response body, in bytes.
    void setBodyLimit(std::uint64_t bytes) { mBodyLimit = bytes; }

    const std::string& host() const { return mHost; }
    const std::string& port() const { return mPort; }
    bool useSsl() const { return mUseSsl; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;
    std::uint64_t mBodyLimit = kDefaultBodyLimit;
};

} // namespace wfmk
