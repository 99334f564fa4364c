#include "hub/hash_cache.h"

#include <spdlog/spdlog.h>
#include <system_error>

#include "hub/hub_error.h"

namespace fs = std::filesystem;

namespace fakehub {

namespace {

FileDigests computeOrThrow(const DigestFunction& compute, const fs::path& path) {
    auto digests = compute(path);
    if (!digests) {
        throw IoError("failed to read file for hashing: " + path.filename().string());
    }
    return *digests;
}

}  // namespace

HashCacheKey makeHashCacheKey(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;
    abs = abs.lexically_normal();

    const auto size = fs::file_size(abs, ec);
    if (ec) {
        throw IoError("failed to stat file: " + path.filename().string());
    }
    const auto mtime = fs::last_write_time(abs, ec);
    if (ec) {
        throw IoError("failed to stat file: " + path.filename().string());
    }
    return HashCacheKey{abs.string(), static_cast<uint64_t>(size),
                        static_cast<int64_t>(mtime.time_since_epoch().count())};
}

DigestFunction fileDigestFunction(size_t chunk_bytes) {
    return [chunk_bytes](const fs::path& path) { return digest_file(path, chunk_bytes); };
}

InMemoryHashCache::InMemoryHashCache(DigestFunction compute) : compute_(std::move(compute)) {}

FileDigests InMemoryHashCache::digest(const fs::path& path) {
    const HashCacheKey key = makeHashCacheKey(path);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) return it->second;
    }

    spdlog::debug("HashCache: hashing {} ({} bytes)", key.absolute_path, key.size_bytes);
    FileDigests digests = computeOrThrow(compute_, path);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = digests;
    return digests;
}

size_t InMemoryHashCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryHashCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

UncachedHashCache::UncachedHashCache(DigestFunction compute) : compute_(std::move(compute)) {}

FileDigests UncachedHashCache::digest(const fs::path& path) {
    return computeOrThrow(compute_, path);
}

std::unique_ptr<HashCache> makeHashCache(const std::string& mode, size_t chunk_bytes) {
    if (mode == "none") {
        return std::make_unique<UncachedHashCache>(fileDigestFunction(chunk_bytes));
    }
    if (mode != "memory" && !mode.empty()) {
        spdlog::warn("Unknown hash cache mode '{}', using 'memory'", mode);
    }
    return std::make_unique<InMemoryHashCache>(fileDigestFunction(chunk_bytes));
}

}  // namespace fakehub
