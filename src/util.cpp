#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace wfmk {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::optional<std::chrono::seconds> parseDuration(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    std::size_t digits = 0;
    while (digits < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits == 0 || text.size() - digits > 1) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(text.substr(0, digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    const char unit = digits < text.size() ? text[digits] : 's';
    long long multiplier = 0;
    switch (unit) {
        case 'd': multiplier = 86400; break;
        case 'h': multiplier = 3600;  break;
        case 'm': multiplier = 60;    break;
        case 's': multiplier = 1;     break;
        default:  return std::nullopt;
    }

    if (value > maxDuration().count() / multiplier) {
        return std::nullopt;
    }
    return std::chrono::seconds(value * multiplier);
}

std::chrono::seconds maxDuration() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::duration::max());
}

std::vector<std::string> readLines(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) {
        throw std::runtime_error("cannot open " + file.string());
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

std::filesystem::path defaultCacheDir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "warframe-market";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".cache" / "warframe-market";
    }
    return std::filesystem::temp_directory_path() / "warframe-market";
}

} // namespace wfmk
