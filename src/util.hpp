#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wfmk {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/v1")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Parse a cache lifetime: "1d", "24h", "1440m", "86400s" or "86400".
/// Only one unit is allowed. Returns nullopt on anything else, including
/// values longer than maxDuration().
std::optional<std::chrono::seconds> parseDuration(const std::string& text);

/// Longest duration a system_clock time point difference can represent.
std::chrono::seconds maxDuration();

/// Read a text file into a list of lines (trailing CR stripped, empty lines
/// skipped). Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> readLines(const std::filesystem::path& file);

/// $XDG_CACHE_HOME/warframe-market, else ~/.cache/warframe-market.
std::filesystem::path defaultCacheDir();

} // namespace wfmk
