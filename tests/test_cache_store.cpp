/// @file test_cache_store.cpp
/// Unit tests for cache_store.hpp: memory, disk and null stores.

#include "cache_store.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace wfmk;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

// Millisecond-aligned so the disk round trip is exact.
static const TimePoint kT0 = TimePoint(std::chrono::milliseconds(1700000000000LL));

// ============================================================================
// isFresh
// ============================================================================

TEST(IsFresh, FreshJustBeforeTtlStaleJustAfter) {
    CacheEntry entry{"k", "v", kT0};

    EXPECT_TRUE(isFresh(entry, 60s, kT0));
    EXPECT_TRUE(isFresh(entry, 60s, kT0 + 60s - 1ms));
    EXPECT_FALSE(isFresh(entry, 60s, kT0 + 60s));
    EXPECT_FALSE(isFresh(entry, 60s, kT0 + 60s + 1ms));
}

TEST(IsFresh, ZeroTtlIsNeverFresh) {
    CacheEntry entry{"k", "v", kT0};
    EXPECT_FALSE(isFresh(entry, 0s, kT0));
}

TEST(IsFresh, HugeTtlKeepsRecentEntryFresh) {
    CacheEntry entry{"k", "v", kT0 - 1s};

    const auto longest =
        std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max());
    EXPECT_TRUE(isFresh(entry, longest, kT0));
    EXPECT_TRUE(isFresh(entry, std::chrono::seconds(17280000000LL), kT0));
    EXPECT_TRUE(isFresh(entry, std::chrono::seconds::max(), kT0));
}

// ============================================================================
// Shared behaviour of the persistent stores
// ============================================================================

class CacheStoreTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        std::random_device rd;
        mRoot = fs::temp_directory_path() /
                ("wfmk_cache_test_" + std::to_string(rd()));
        if (GetParam()) {
            mStore = std::make_unique<DiskCacheStore>(mRoot);
        } else {
            mStore = std::make_unique<MemoryCacheStore>();
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(mRoot, ec);
    }

    fs::path                    mRoot;
    std::unique_ptr<CacheStore> mStore;
};

TEST_P(CacheStoreTest, MissOnUnknownKey) {
    EXPECT_FALSE(mStore->get("all_items-pc-en").has_value());
}

TEST_P(CacheStoreTest, PutThenGetReturnsEntry) {
    mStore->put("all_items-pc-en", R"({"items":[]})", kT0);

    auto entry = mStore->get("all_items-pc-en");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->key, "all_items-pc-en");
    EXPECT_EQ(entry->payload, R"({"items":[]})");
    EXPECT_EQ(entry->storedAt, kT0);
}

TEST_P(CacheStoreTest, OverwriteReplacesNeverMerges) {
    mStore->put("ash_prime_set-orders-pc-en", "first payload, quite long", kT0);
    mStore->put("ash_prime_set-orders-pc-en", "v2", kT0 + 5s);

    auto entry = mStore->get("ash_prime_set-orders-pc-en");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->payload, "v2");
    EXPECT_EQ(entry->storedAt, kT0 + 5s);
}

TEST_P(CacheStoreTest, GetReturnsStaleEntriesToo) {
    mStore->put("k", "old", kT0 - 48h);
    auto entry = mStore->get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(isFresh(*entry, 24h, kT0));
}

TEST_P(CacheStoreTest, KeysForDifferentPlatformsDoNotCollide) {
    mStore->put("all_items-pc-en", "pc", kT0);
    mStore->put("all_items-ps4-en", "ps4", kT0);
    mStore->put("all_items-pc-de", "pc-de", kT0);

    EXPECT_EQ(mStore->get("all_items-pc-en")->payload, "pc");
    EXPECT_EQ(mStore->get("all_items-ps4-en")->payload, "ps4");
    EXPECT_EQ(mStore->get("all_items-pc-de")->payload, "pc-de");
}

TEST_P(CacheStoreTest, ClearWipesEveryKey) {
    const std::vector<std::string> keys = {"a", "b-orders-pc-en", "all_items-xbox-fr"};
    for (const auto& k : keys) {
        mStore->put(k, "payload " + k, kT0);
    }

    mStore->clear();

    for (const auto& k : keys) {
        EXPECT_FALSE(mStore->get(k).has_value()) << k;
    }
}

TEST_P(CacheStoreTest, ClearOnEmptyStoreSucceeds) {
    EXPECT_NO_THROW(mStore->clear());
    EXPECT_NO_THROW(mStore->clear());
}

TEST_P(CacheStoreTest, ConcurrentWritersToSameKeyLeaveOneWholePayload) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, i] {
            for (int j = 0; j < 20; ++j) {
                mStore->put("k", std::string(1000, static_cast<char>('a' + i)), kT0);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto entry = mStore->get("k");
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->payload.size(), 1000u);
    EXPECT_EQ(entry->payload.find_first_not_of(entry->payload[0]), std::string::npos);
}

INSTANTIATE_TEST_SUITE_P(MemoryAndDisk, CacheStoreTest, ::testing::Values(false, true),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? std::string("Disk") : std::string("Memory");
                         });

// ============================================================================
// DiskCacheStore specifics
// ============================================================================

class DiskCacheStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        mRoot = fs::temp_directory_path() /
                ("wfmk_disk_test_" + std::to_string(rd()));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(mRoot, ec);
    }

    fs::path mRoot;
};

TEST_F(DiskCacheStoreTest, PutCreatesRootOnDemand) {
    DiskCacheStore store(mRoot / "nested");
    store.put("k", "v", kT0);
    EXPECT_TRUE(fs::is_regular_file(store.pathFor("k")));
}

TEST_F(DiskCacheStoreTest, EntriesSurviveANewStoreInstance) {
    {
        DiskCacheStore writer(mRoot);
        writer.put("ash_prime_set-orders-pc-en", "{}", kT0);
    }

    DiskCacheStore reopened(mRoot);
    auto entry = reopened.get("ash_prime_set-orders-pc-en");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->storedAt, kT0);
}

TEST_F(DiskCacheStoreTest, KeysAreSanitizedIntoRoot) {
    DiskCacheStore store(mRoot);
    auto path = store.pathFor("../../etc/passwd");
    EXPECT_EQ(path.parent_path(), mRoot);
}

TEST_F(DiskCacheStoreTest, CorruptHeaderIsAMiss) {
    DiskCacheStore store(mRoot);
    store.put("k", "v", kT0);

    {
        std::ofstream out(store.pathFor("k"), std::ios::trunc);
        out << "{\"payload\": garbage";
    }

    EXPECT_FALSE(store.get("k").has_value());
}

TEST_F(DiskCacheStoreTest, CorruptTimestampIsAMiss) {
    DiskCacheStore store(mRoot);
    store.put("a", "{}", kT0);
    ASSERT_TRUE(store.get("a").has_value());

    const auto rewrite = [&](const std::string& stamp) {
        std::ofstream out(store.pathFor("a"), std::ios::binary | std::ios::trunc);
        out << "wfmk-cache 1 " << stamp << "\n{}";
    };

    rewrite("9223372036854775807");
    EXPECT_FALSE(store.get("a").has_value());

    rewrite("-5");
    EXPECT_FALSE(store.get("a").has_value());

    const auto nextWeek = std::chrono::duration_cast<std::chrono::milliseconds>(
        (Clock::now() + 168h).time_since_epoch());
    rewrite(std::to_string(nextWeek.count()));
    EXPECT_FALSE(store.get("a").has_value());
}

TEST_F(DiskCacheStoreTest, KeysDifferingOnlyInUnsafeCharactersDoNotCollide) {
    DiskCacheStore store(mRoot);
    store.put("x-orders-pc-zh/hans", R"({"v":1})", kT0);

    EXPECT_NE(store.pathFor("x-orders-pc-zh/hans"), store.pathFor("x-orders-pc-zh?hans"));
    EXPECT_NE(store.pathFor("a_b"), store.pathFor("a b"));
    EXPECT_NE(store.pathFor("a%2Fb"), store.pathFor("a/b"));
    EXPECT_FALSE(store.get("x-orders-pc-zh?hans").has_value());
    EXPECT_EQ(store.get("x-orders-pc-zh/hans")->payload, R"({"v":1})");
}

TEST_F(DiskCacheStoreTest, EmptyFileIsAMiss) {
    DiskCacheStore store(mRoot);
    store.put("k", "v", kT0);
    { std::ofstream out(store.pathFor("k"), std::ios::trunc); }

    EXPECT_FALSE(store.get("k").has_value());
}

TEST_F(DiskCacheStoreTest, RootThatIsAFileDegradesToMisses) {
    // put() and get() absorb the failure; clear() reports it.
    {
        std::ofstream out(mRoot);
        out << "not a directory";
    }
    DiskCacheStore store(mRoot);

    EXPECT_NO_THROW(store.put("k", "v", kT0));
    EXPECT_FALSE(store.get("k").has_value());
    EXPECT_THROW(store.clear(), CacheError);
}

TEST_F(DiskCacheStoreTest, ClearRemovesTheDirectoryWhenEmpty) {
    DiskCacheStore store(mRoot);
    store.put("a", "1", kT0);
    store.put("b", "2", kT0);

    store.clear();
    EXPECT_FALSE(fs::exists(mRoot));
}

TEST_F(DiskCacheStoreTest, ClearKeepsForeignSubdirectories) {
    DiskCacheStore store(mRoot);
    store.put("a", "1", kT0);
    fs::create_directories(mRoot / "keep");

    store.clear();
    EXPECT_FALSE(store.get("a").has_value());
    EXPECT_TRUE(fs::is_directory(mRoot / "keep"));
}

TEST_F(DiskCacheStoreTest, ClearOnMissingRootSucceeds) {
    DiskCacheStore store(mRoot / "never-created");
    EXPECT_NO_THROW(store.clear());
}

// ============================================================================
// NullCacheStore
// ============================================================================

TEST(NullCacheStore, AlwaysMisses) {
    NullCacheStore store;
    store.put("k", "v", kT0);
    EXPECT_FALSE(store.get("k").has_value());
    EXPECT_NO_THROW(store.clear());
}

TEST(MemoryCacheStore, SizeTracksDistinctKeys) {
    MemoryCacheStore store;
    store.put("a", "1", kT0);
    store.put("a", "2", kT0);
    store.put("b", "3", kT0);
    EXPECT_EQ(store.size(), 2u);
    store.clear();
    EXPECT_EQ(store.size(), 0u);
}
