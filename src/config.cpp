#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace wfmk {

namespace {

int parseInt(const std::string& option, const std::string& text) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // fall through
    }
    throw ConfigError("argument " + option + ": invalid int value: '" + text + "'");
}

// "en", "de", "zh-hans", ...
std::string parseLanguage(const std::string& option, const std::string& text) {
    static const std::regex kLanguage("[A-Za-z]{2,3}(-[A-Za-z0-9]{2,8})?");
    if (!std::regex_match(text, kLanguage)) {
        throw ConfigError("argument " + option + ": invalid language code: '" + text + "'");
    }
    return text;
}

std::chrono::seconds parseTtl(const std::string& option, const std::string& text) {
    auto ttl = parseDuration(text);
    if (!ttl) {
        throw ConfigError("argument " + option + ": invalid time value: '" + text + "'");
    }
    return *ttl;
}

} // namespace

void printUsage(std::ostream& out) {
    out
        << "Usage: wfmk [options] item...\n\n"
        << "Look up information about Warframe items on warframe.market.\n"
        << "Items are not case-sensitive and may contain the wildcards *, ?\n"
        << "and [] (which behave like bash).\n\n"
        << "Actions:\n"
        << "  --clear-cache        Delete the contents of the local disk cache\n"
        << "  -l, --list           List items matching the specified name patterns\n"
        << "  -O, --orders         List an item's current orders (the default)\n"
        << "  -s, --summary        Show only a summary of the item's prices\n\n"
        << "Cache options:\n"
        << "  -C, --cache-dir DIR  Directory for the local disk cache\n"
        << "                       (default: " << defaultCacheDir().string() << ")\n"
        << "  --no-cache           Disable the local disk cache\n"
        << "  --ttl-items T        How long to cache the item list     (default: 1d)\n"
        << "  --ttl-orders T       How long to cache an item's orders  (default: 10m)\n"
        << "  --rate-limit N       API requests per minute             (default: 180)\n"
        << "  --timeout-ms N       Per-request HTTP timeout            (default: 15000)\n"
        << "  --api-url URL        API base URL (default: https://api.warframe.market)\n\n"
        << "Miscellaneous options:\n"
        << "  -a, --all            Show all matching users (not only the top 5)\n"
        << "  -b, --buyers         Show only users looking to buy the item\n"
        << "  -f, --file FILE      Read items from FILE, one per line (repeatable)\n"
        << "  -P, --platform P     pc, ps4, switch or xbox         (default: pc)\n"
        << "  -L, --language L     Language code, e.g. de, en, fr  (default: en)\n"
        << "  -r, --reverse        Reverse the sorting order\n"
        << "  -v, --verbose        More messages (repeatable)\n"
        << "  -q, --quiet          Fewer messages (repeatable)\n"
        << "  -d, --debug N        Set the debug message mask directly\n"
        << "  -h, --help           Show this message\n\n"
        << "Examples:\n"
        << "  wfmk \"ammo drum\"            current selling price of Ammo Drum\n"
        << "  wfmk -s -b \"Ember Prime*\"   buying prices of all Ember Prime parts\n"
        << "  wfmk -l \"*rubedo*\"          list all items containing \"rubedo\"\n"
        << "  wfmk -l \"xiphos [!s]*\"      Xiphos parts, but not the set\n";
}

Config parseArgs(int argc, const char* const argv[]) {
    Config cfg;
    cfg.cacheDir = defaultCacheDir();

    int  verboseCount = 0;
    int  quietCount   = 0;
    int  debugMask    = -1;
    int  actionCount  = 0;

    auto setAction = [&](Action a) {
        cfg.action = a;
        ++actionCount;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string inlineValue;
        bool hasInlineValue = false;

        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inlineValue    = arg.substr(eq + 1);
                arg            = arg.substr(0, eq);
                hasInlineValue = true;
            }
        }

        auto value = [&]() -> std::string {
            if (hasInlineValue) {
                return inlineValue;
            }
            if (i + 1 >= argc) {
                throw ConfigError("argument " + arg + ": expected one argument");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cfg.showHelp = true;
        } else if (arg == "--clear-cache") {
            setAction(Action::ClearCache);
        } else if (arg == "--list" || arg == "-l") {
            setAction(Action::List);
        } else if (arg == "--orders" || arg == "-O") {
            setAction(Action::Orders);
        } else if (arg == "--summary" || arg == "-s") {
            setAction(Action::Summary);
        } else if (arg == "--cache-dir" || arg == "-C") {
            cfg.cacheDir = value();
        } else if (arg == "--no-cache") {
            cfg.cacheEnabled = false;
        } else if (arg == "--ttl-items") {
            cfg.ttlItems = parseTtl(arg, value());
        } else if (arg == "--ttl-orders") {
            cfg.ttlOrders = parseTtl(arg, value());
        } else if (arg == "--rate-limit") {
            cfg.rateLimit = parseInt(arg, value());
        } else if (arg == "--timeout-ms") {
            cfg.timeoutMs = parseInt(arg, value());
        } else if (arg == "--api-url") {
            cfg.baseUrl = value();
        } else if (arg == "--all" || arg == "-a") {
            cfg.showAll = true;
        } else if (arg == "--buyers" || arg == "-b") {
            cfg.buyers = true;
        } else if (arg == "--file" || arg == "-f") {
            cfg.files.push_back(value());
        } else if (arg == "--platform" || arg == "-P") {
            cfg.platform = parsePlatform(value());
        } else if (arg == "--language" || arg == "-L") {
            cfg.language = parseLanguage(arg, value());
        } else if (arg == "--reverse" || arg == "-r") {
            cfg.reverse = true;
        } else if (arg == "--debug" || arg == "-d") {
            debugMask = parseInt(arg, value());
        } else if (arg == "--verbose") {
            ++verboseCount;
        } else if (arg == "--quiet") {
            ++quietCount;
        } else if (arg.size() > 1 && arg[0] == '-' &&
                   arg.find_first_not_of(arg[1], 1) == std::string::npos &&
                   (arg[1] == 'v' || arg[1] == 'q')) {
            // -v, -vv, -qqq ...
            (arg[1] == 'v' ? verboseCount : quietCount) +=
                static_cast<int>(arg.size() - 1);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw ConfigError("unrecognized argument: " + arg);
        } else {
            cfg.items.push_back(arg);
        }
    }

    if (actionCount > 1) {
        throw ConfigError("only one of --clear-cache, --list, --orders and "
                          "--summary may be given");
    }

    if (debugMask >= 0) {
        cfg.verbosity = debugMask;
    } else if (verboseCount > quietCount) {
        // -v = 1, -vv = 3, -vvv = 7, -vvvv = 15, ...
        cfg.verbosity = (1 << std::min(verboseCount - quietCount, 30)) - 1;
    }

    if (!cfg.showHelp && cfg.action != Action::ClearCache &&
        cfg.items.empty() && cfg.files.empty()) {
        throw ConfigError("-f or item arguments are required");
    }

    return cfg;
}

} // namespace wfmk
