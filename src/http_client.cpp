#include "http_client.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef WFMK_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <chrono>
#include <cstdint>
#include <iostream>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace wfmk {

namespace {

using Deadline = std::chrono::steady_clock::time_point;

[[noreturn]] void fail(const beast::error_code& ec,
                       const std::string& what,
                       Deadline deadline) {
    if (ec == http::error::body_limit) {
        throw TransportError(ErrorKind::MalformedResponse,
                             what + " failed: response body too large");
    }
    if (ec == beast::error::timeout ||
        std::chrono::steady_clock::now() >= deadline) {
        throw TransportError(ErrorKind::Timeout, what + " timed out");
    }
    throw TransportError(ErrorKind::NetworkUnreachable,
                         what + " failed: " + ec.message());
}

// Each step starts exactly one async operation; run it to completion and
// re-arm the context for the next step.
void runPending(net::io_context& ioc) {
    ioc.run();
    ioc.restart();
}

tcp::resolver::results_type resolve(net::io_context& ioc,
                                    const std::string& host,
                                    const std::string& port,
                                    Deadline deadline) {
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    beast::error_code ec;
    bool done = false;

    resolver.async_resolve(host, port,
        [&](beast::error_code e, tcp::resolver::results_type r) {
            ec      = e;
            results = std::move(r);
            done    = true;
        });

    // The resolver has no timer of its own.
    ioc.run_until(deadline);
    if (!done) {
        resolver.cancel();
        throw TransportError(ErrorKind::Timeout,
                             "resolving " + host + " timed out");
    }
    ioc.restart();

    if (ec) {
        fail(ec, "resolving " + host, deadline);
    }
    return results;
}

template <class Stream>
void connect(net::io_context& ioc,
             Stream& stream,
             const tcp::resolver::results_type& results,
             Deadline deadline) {
    beast::error_code ec;
    auto& lowest = beast::get_lowest_layer(stream);
    lowest.expires_at(deadline);
    lowest.async_connect(results,
        [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    runPending(ioc);
    if (ec) {
        fail(ec, "connect", deadline);
    }
}

template <class Stream>
HttpClient::Response exchange(net::io_context& ioc,
                              Stream& stream,
                              const http::request<http::empty_body>& req,
                              std::uint64_t bodyLimit,
                              Deadline deadline) {
    beast::error_code ec;

    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_write(stream, req,
        [&](beast::error_code e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec) {
        fail(ec, "sending request", deadline);
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(bodyLimit);

    beast::get_lowest_layer(stream).expires_at(deadline);
    http::async_read(stream, buffer, parser,
        [&](beast::error_code e, std::size_t) { ec = e; });
    runPending(ioc);
    if (ec) {
        fail(ec, "reading response", deadline);
    }

    auto res = parser.release();

    HttpClient::Response response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

HttpClient::HttpClient(const std::string& baseUrl, int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    if (timeoutMs <= 0) {
        throw ConfigError("timeout must be positive, got " +
                          std::to_string(timeoutMs) + " ms");
    }

    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target == "/" ? "" : parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef WFMK_HAS_SSL
        throw ConfigError(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

HttpClient::Response
HttpClient::get(const std::string& target, const Headers& headers) const
{
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(mTimeoutMs);
    const std::string fullTarget = mBasePath + target;

    if (mVerbose) {
        std::cerr << "[HttpClient] GET " << (mUseSsl ? "https://" : "http://")
                  << mHost << ":" << mPort << fullTarget << "\n";
    }

    http::request<http::empty_body> req{http::verb::get, fullTarget, 11};
    req.set(http::field::host, mHost);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "wfmk/1.0");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }

    net::io_context ioc;
    const auto results = resolve(ioc, mHost, mPort, deadline);

    Response response;

    if (!mUseSsl) {
        beast::tcp_stream stream(ioc);
        connect(ioc, stream, results, deadline);
        response = exchange(ioc, stream, req, mBodyLimit, deadline);

        // Graceful shutdown (non-critical errors are swallowed).
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    } else {
#ifdef WFMK_HAS_SSL
        namespace ssl = net::ssl;

        ssl::context ctx(ssl::context::tlsv12_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
            throw TransportError(ErrorKind::NetworkUnreachable,
                                 "failed to set SNI hostname " + mHost);
        }

        connect(ioc, stream, results, deadline);

        beast::error_code ec;
        beast::get_lowest_layer(stream).expires_at(deadline);
        stream.async_handshake(ssl::stream_base::client,
            [&](beast::error_code e) { ec = e; });
        runPending(ioc);
        if (ec) {
            fail(ec, "TLS handshake with " + mHost, deadline);
        }

        response = exchange(ioc, stream, req, mBodyLimit, deadline);

        // Many servers never answer close_notify; just drop the socket.
        beast::get_lowest_layer(stream).close();
#endif
    }

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << " ("
                  << response.body.size() << " bytes)\n";
    }

    return response;
}

} // namespace wfmk
