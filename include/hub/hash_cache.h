#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "utils/digest.h"

namespace fakehub {

// Invalidation signature of a file: a changed size or mtime yields a new key.
struct HashCacheKey {
    std::string absolute_path;
    uint64_t size_bytes{0};
    int64_t mtime_ticks{0};

    bool operator==(const HashCacheKey& other) const {
        return size_bytes == other.size_bytes && mtime_ticks == other.mtime_ticks &&
               absolute_path == other.absolute_path;
    }
};

struct HashCacheKeyHash {
    size_t operator()(const HashCacheKey& key) const {
        size_t h = std::hash<std::string>{}(key.absolute_path);
        h ^= std::hash<uint64_t>{}(key.size_bytes) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<int64_t>{}(key.mtime_ticks) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

// Throws IoError when the file cannot be stat'ed.
HashCacheKey makeHashCacheKey(const std::filesystem::path& path);

using DigestFunction = std::function<std::optional<FileDigests>(const std::filesystem::path&)>;

// Default digest function: digest_file() with the given chunk size.
DigestFunction fileDigestFunction(size_t chunk_bytes = kDefaultHashChunkBytes);

/// Content digests for files on disk.
///
/// Implementations throw IoError when the file cannot be opened or read.
class HashCache {
public:
    virtual ~HashCache() = default;
    virtual FileDigests digest(const std::filesystem::path& path) = 0;
};

/// Process-lifetime memo keyed by (path, size, mtime).
///
/// The lock covers map access only. Two concurrent misses on the same file
/// both hash it; the second store overwrites the first with an equal value.
/// Entries for changed files are shadowed by the new key, never evicted.
class InMemoryHashCache : public HashCache {
public:
    explicit InMemoryHashCache(DigestFunction compute = fileDigestFunction());

    FileDigests digest(const std::filesystem::path& path) override;

    size_t size() const;
    void clear();

private:
    DigestFunction compute_;
    mutable std::mutex mutex_;
    std::unordered_map<HashCacheKey, FileDigests, HashCacheKeyHash> entries_;
};

// Hashes on every call.
class UncachedHashCache : public HashCache {
public:
    explicit UncachedHashCache(DigestFunction compute = fileDigestFunction());

    FileDigests digest(const std::filesystem::path& path) override;

private:
    DigestFunction compute_;
};

// mode: "memory" (default) or "none". Unknown modes fall back to "memory".
std::unique_ptr<HashCache> makeHashCache(const std::string& mode, size_t chunk_bytes = kDefaultHashChunkBytes);

}  // namespace fakehub
