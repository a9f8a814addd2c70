#pragma once

#include "models.hpp"

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace wfmk {

enum class Action { Orders, Summary, List, ClearCache };

struct Config {
    Action                   action       = Action::Orders;
    std::vector<std::string> items;
    std::vector<std::string> files;

    // --- cache ---
    std::filesystem::path    cacheDir;
    bool                     cacheEnabled = true;
    std::chrono::seconds     ttlItems     = std::chrono::hours(24);
    std::chrono::seconds     ttlOrders    = std::chrono::minutes(10);
    int                      rateLimit    = 180;   // requests per minute
    int                      timeoutMs    = 15000;

    // --- query / output ---
    std::string              baseUrl      = "https://api.warframe.market";
    Platform                 platform     = Platform::Pc;
    std::string              language     = "en";
    bool                     showAll      = false;
    bool                     buyers       = false;
    bool                     reverse      = false;
    int                      verbosity    = 0;     // bit mask, see Verbosity
    bool                     showHelp     = false;
};

void printUsage(std::ostream& out);

/// Parse the command line. Throws ConfigError on invalid input.
/// Item files (-f) are recorded, not read.
Config parseArgs(int argc, const char* const argv[]);

} // namespace wfmk
