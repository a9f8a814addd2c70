#pragma once

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace wfmk {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct CacheEntry {
    std::string key;
    std::string payload;   // opaque to the store
    TimePoint   storedAt;
};

/// Fresh iff now - storedAt < ttl.
bool isFresh(const CacheEntry& entry, std::chrono::seconds ttl, TimePoint now);

/// Key/value persistence for API payloads. Freshness is the caller's concern:
/// get() returns whatever is stored, fresh or not.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<CacheEntry> get(const std::string& key) = 0;

    /// Overwrites any existing entry for @p key.
    virtual void put(const std::string& key,
                     const std::string& payload,
                     TimePoint storedAt) = 0;

    /// Remove every entry. Throws CacheError if the backing storage refuses.
    virtual void clear() = 0;
};

/// Caching disabled: always a miss, writes are dropped.
class NullCacheStore : public CacheStore {
public:
    std::optional<CacheEntry> get(const std::string&) override { return std::nullopt; }
    void put(const std::string&, const std::string&, TimePoint) override {}
    void clear() override {}
};

class MemoryCacheStore : public CacheStore {
public:
    std::optional<CacheEntry> get(const std::string& key) override;
    void put(const std::string& key,
             const std::string& payload,
             TimePoint storedAt) override;
    void clear() override;

    std::size_t size() const;

private:
    mutable std::mutex                          mMutex;
    std::unordered_map<std::string, CacheEntry> mEntries;
};

/// One file per key under a root directory. Each file starts with a header
/// line carrying the write time, followed by the raw payload bytes.
/// Unreadable or corrupt files are reported as misses.
class DiskCacheStore : public CacheStore {
public:
    explicit DiskCacheStore(std::filesystem::path root, bool verbose = false);

    std::optional<CacheEntry> get(const std::string& key) override;
    void put(const std::string& key,
             const std::string& payload,
             TimePoint storedAt) override;

    /// Deletes the cache files, then the root itself if it is left empty.
    /// A missing root is not an error.
    void clear() override;

    const std::filesystem::path& root() const { return mRoot; }

    /// File that holds @p key. Characters outside [A-Za-z0-9._-] are
    /// percent-escaped.
    std::filesystem::path pathFor(const std::string& key) const;

private:
    std::filesystem::path mRoot;
    bool                  mVerbose;

    void writeAtomic(const std::filesystem::path& path, const std::string& bytes) const;
};

} // namespace wfmk
