/// @file test_config.cpp
/// Unit tests for config.hpp: command-line parsing.

#include "config.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace wfmk;
using namespace std::chrono_literals;

static Config parse(std::vector<const char*> args) {
    args.insert(args.begin(), "wfmk");
    return parseArgs(static_cast<int>(args.size()), args.data());
}

// ============================================================================
// Defaults
// ============================================================================

TEST(ParseArgs, Defaults) {
    auto cfg = parse({"ammo drum"});

    EXPECT_EQ(cfg.action, Action::Orders);
    ASSERT_EQ(cfg.items.size(), 1u);
    EXPECT_EQ(cfg.items[0], "ammo drum");
    EXPECT_TRUE(cfg.cacheEnabled);
    EXPECT_EQ(cfg.ttlItems, 24h);
    EXPECT_EQ(cfg.ttlOrders, 10min);
    EXPECT_EQ(cfg.rateLimit, 180);
    EXPECT_EQ(cfg.timeoutMs, 15000);
    EXPECT_EQ(cfg.platform, Platform::Pc);
    EXPECT_EQ(cfg.language, "en");
    EXPECT_EQ(cfg.verbosity, 0);
    EXPECT_FALSE(cfg.cacheDir.empty());
}

// ============================================================================
// Actions
// ============================================================================

TEST(ParseArgs, EachActionFlag) {
    EXPECT_EQ(parse({"-s", "x"}).action, Action::Summary);
    EXPECT_EQ(parse({"--list", "x"}).action, Action::List);
    EXPECT_EQ(parse({"-O", "x"}).action, Action::Orders);
    EXPECT_EQ(parse({"--clear-cache"}).action, Action::ClearCache);
}

TEST(ParseArgs, ActionsAreMutuallyExclusive) {
    EXPECT_THROW(parse({"-s", "-l", "x"}), ConfigError);
}

TEST(ParseArgs, ItemsOrFileRequired) {
    EXPECT_THROW(parse({"-s"}), ConfigError);
    EXPECT_NO_THROW(parse({"-f", "items.txt"}));
    EXPECT_NO_THROW(parse({"--help"}));
}

// ============================================================================
// Options with values
// ============================================================================

TEST(ParseArgs, CacheOptions) {
    auto cfg = parse({"--no-cache", "-C", "/tmp/wfmk", "--ttl-items", "2h",
                      "--ttl-orders=30s", "--rate-limit", "60", "x"});

    EXPECT_FALSE(cfg.cacheEnabled);
    EXPECT_EQ(cfg.cacheDir, std::filesystem::path("/tmp/wfmk"));
    EXPECT_EQ(cfg.ttlItems, 2h);
    EXPECT_EQ(cfg.ttlOrders, 30s);
    EXPECT_EQ(cfg.rateLimit, 60);
}

TEST(ParseArgs, InvalidTtlNamesTheOption) {
    try {
        parse({"--ttl-orders", "soon", "x"});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "argument --ttl-orders: invalid time value: 'soon'");
    }
}

TEST(ParseArgs, NonNumericRateLimitIsRejected) {
    EXPECT_THROW(parse({"--rate-limit", "fast", "x"}), ConfigError);
}

TEST(ParseArgs, MissingValueIsRejected) {
    EXPECT_THROW(parse({"x", "--ttl-items"}), ConfigError);
}

TEST(ParseArgs, PlatformAndLanguage) {
    auto cfg = parse({"-P", "switch", "--language=de", "x"});
    EXPECT_EQ(cfg.platform, Platform::Switch);
    EXPECT_EQ(cfg.language, "de");
    EXPECT_THROW(parse({"-P", "stadia", "x"}), ConfigError);
}

TEST(ParseArgs, LanguageMustBeAShortCode) {
    EXPECT_EQ(parse({"-L", "zh-hans", "x"}).language, "zh-hans");
    EXPECT_THROW(parse({"-L", "zh/hans", "x"}), ConfigError);
    EXPECT_THROW(parse({"-L", "zh?hans", "x"}), ConfigError);
    EXPECT_THROW(parse({"--language=en\r\nX-Injected: 1", "x"}), ConfigError);
    EXPECT_THROW(parse({"-L", "", "x"}), ConfigError);
}

TEST(ParseArgs, FilesAreRepeatable) {
    auto cfg = parse({"-f", "a.txt", "--file", "b.txt"});
    ASSERT_EQ(cfg.files.size(), 2u);
    EXPECT_EQ(cfg.files[1], "b.txt");
    EXPECT_TRUE(cfg.items.empty());
}

TEST(ParseArgs, UnknownOptionIsRejected) {
    EXPECT_THROW(parse({"--frobnicate", "x"}), ConfigError);
}

// ============================================================================
// Verbosity
// ============================================================================

TEST(ParseArgs, VerboseFlagsBuildAMask) {
    EXPECT_EQ(parse({"-v", "x"}).verbosity, 1);
    EXPECT_EQ(parse({"-vv", "x"}).verbosity, 3);
    EXPECT_EQ(parse({"-v", "--verbose", "-v", "x"}).verbosity, 7);
    EXPECT_EQ(parse({"-vvv", "-q", "x"}).verbosity, 3);
    EXPECT_EQ(parse({"-q", "x"}).verbosity, 0);
}

TEST(ParseArgs, DebugMaskOverridesVerbose) {
    EXPECT_EQ(parse({"-vvvv", "-d", "8", "x"}).verbosity, 8);
}

// ============================================================================
// Usage
// ============================================================================

TEST(PrintUsage, MentionsEveryAction) {
    std::ostringstream out;
    printUsage(out);
    const std::string text = out.str();
    for (const char* flag : {"--clear-cache", "--list", "--orders", "--summary",
                             "--no-cache", "--rate-limit"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}
