#include "cache_store.hpp"
#include "errors.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace wfmk {

namespace {

constexpr const char* kHeaderMagic = "wfmk-cache";
constexpr int         kFormatVersion = 1;
constexpr const char* kEntryExt = ".cache";

// Headers stamped further ahead than this are treated as corrupt.
constexpr std::chrono::minutes kMaxClockSkew{5};

long long toUnixMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               tp.time_since_epoch()).count();
}

// nullopt unless 0 <= ms and the value fits Clock::duration.
std::optional<TimePoint> fromUnixMs(long long ms) {
    const auto maxMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max());
    if (ms < 0 || ms > maxMs.count()) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::milliseconds(ms)));
}

} // namespace

bool isFresh(const CacheEntry& entry, std::chrono::seconds ttl, TimePoint now) {
    // Compare in Clock::duration; a larger TTL would overflow the conversion.
    const auto maxTtl = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max());
    const auto limit  = std::chrono::duration_cast<Clock::duration>(std::min(ttl, maxTtl));
    return now - entry.storedAt < limit;
}

// ---------------------------------------------------------------------------
// MemoryCacheStore
// ---------------------------------------------------------------------------

std::optional<CacheEntry> MemoryCacheStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mEntries.find(key);
    if (it == mEntries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryCacheStore::put(const std::string& key,
                           const std::string& payload,
                           TimePoint storedAt) {
    std::lock_guard<std::mutex> lock(mMutex);
    mEntries[key] = CacheEntry{key, payload, storedAt};
}

void MemoryCacheStore::clear() {
    std::lock_guard<std::mutex> lock(mMutex);
    mEntries.clear();
}

std::size_t MemoryCacheStore::size() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mEntries.size();
}

// ---------------------------------------------------------------------------
// DiskCacheStore
// ---------------------------------------------------------------------------

DiskCacheStore::DiskCacheStore(fs::path root, bool verbose)
    : mRoot(std::move(root))
    , mVerbose(verbose) {}

fs::path DiskCacheStore::pathFor(const std::string& key) const {
    static const char kHex[] = "0123456789ABCDEF";

    // Percent-escaped, so distinct keys never share a file.
    std::string name;
    name.reserve(key.size());
    for (char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            name += c;
        } else {
            name += '%';
            name += kHex[uc >> 4];
            name += kHex[uc & 0x0F];
        }
    }
    return mRoot / (name + kEntryExt);
}

std::optional<CacheEntry> DiskCacheStore::get(const std::string& key) {
    const auto path = pathFor(key);

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;  // plain miss
    }

    std::string header;
    if (!std::getline(in, header)) {
        std::cerr << "[Cache] Warning: empty cache entry " << path << "\n";
        return std::nullopt;
    }

    std::istringstream hs(header);
    std::string magic;
    int version = 0;
    long long storedAtMs = 0;
    if (!(hs >> magic >> version >> storedAtMs) ||
        magic != kHeaderMagic || version != kFormatVersion) {
        std::cerr << "[Cache] Warning: ignoring corrupt cache entry "
                  << path << "\n";
        return std::nullopt;
    }

    const auto storedAt = fromUnixMs(storedAtMs);
    if (!storedAt || *storedAt > Clock::now() + kMaxClockSkew) {
        std::cerr << "[Cache] Warning: ignoring cache entry with bad timestamp "
                  << path << "\n";
        return std::nullopt;
    }

    std::string payload{std::istreambuf_iterator<char>(in),
                        std::istreambuf_iterator<char>()};
    if (in.bad()) {
        std::cerr << "[Cache] Warning: failed to read cache entry "
                  << path << "\n";
        return std::nullopt;
    }

    return CacheEntry{key, std::move(payload), *storedAt};
}

void DiskCacheStore::put(const std::string& key,
                         const std::string& payload,
                         TimePoint storedAt) {
    const auto path = pathFor(key);

    std::ostringstream oss;
    oss << kHeaderMagic << " " << kFormatVersion << " "
        << toUnixMs(storedAt) << "\n"
        << payload;

    try {
        std::error_code ec;
        fs::create_directories(mRoot, ec);
        if (ec) {
            throw CacheError("cannot create " + mRoot.string() + ": " + ec.message());
        }
        if (!fs::is_directory(mRoot)) {
            throw CacheError(mRoot.string() + " is not a directory");
        }

        writeAtomic(path, oss.str());

        if (mVerbose) {
            std::cerr << "[Cache] Updated " << path << "\n";
        }
    } catch (const std::exception& e) {
        // A failed write only costs a refetch next time.
        std::cerr << "[Cache] Warning: failed to store '" << key
                  << "': " << e.what() << "\n";
    }
}

void DiskCacheStore::writeAtomic(const fs::path& path, const std::string& bytes) const {
    static std::atomic<unsigned> counter{0};

    // Unique per process and thread so concurrent writers of one key never
    // share a temp file; the final rename decides the winner.
    auto tmp = path;
    tmp += ".tmp." + std::to_string(::getpid()) + "." +
           std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
           "." + std::to_string(counter++);

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CacheError("open failed: " + tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw CacheError("write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw CacheError("rename failed: " + path.string() + ": " + ec.message());
    }
}

void DiskCacheStore::clear() {
    std::error_code ec;
    if (!fs::exists(mRoot, ec)) {
        return;
    }
    if (!fs::is_directory(mRoot, ec)) {
        throw CacheError(mRoot.string() + " is not a directory");
    }

    bool empty = true;
    for (fs::directory_iterator it(mRoot, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            std::error_code rmEc;
            fs::remove(it->path(), rmEc);
            if (rmEc) {
                throw CacheError("cannot remove " + it->path().string() +
                                 ": " + rmEc.message());
            }
        } else if (typeEc) {
            throw CacheError("cannot stat " + it->path().string() + ": " + typeEc.message());
        } else {
            empty = false;
        }
    }
    if (ec) {
        throw CacheError("cannot list " + mRoot.string() + ": " + ec.message());
    }

    if (empty) {
        fs::remove(mRoot, ec);
        if (ec) {
            throw CacheError("cannot remove " + mRoot.string() + ": " + ec.message());
        }
    } else {
        std::cerr << "[Cache] Warning: cache dir not empty: " << mRoot << "\n";
    }

    if (mVerbose) {
        std::cerr << "[Cache] Cleared " << mRoot << "\n";
    }
}

} // namespace wfmk
