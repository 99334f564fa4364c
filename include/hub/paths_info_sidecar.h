// PathsInfoSidecar - precomputed per-file digests stored next to a repository
//   <repo_root>/.paths-info.json
//   {"version": 1, "entries": [{"path", "type": "file", "size", "oid", "etag",
//                               "lfs": {"oid": "sha256:<hex>", "size"}}]}
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace fakehub {

class HashCache;

struct SidecarEntry {
    std::string path;
    std::optional<uint64_t> size;
    std::optional<std::string> oid;      // sha1 hex
    std::optional<std::string> lfs_oid;  // "sha256:<hex>"
};

// Explicit integer size recorded and equal to what is on disk. A missing or
// non-integer size never agrees.
bool sizesAgree(const SidecarEntry& entry, uint64_t on_disk_size);

class PathsInfoSidecar {
public:
    PathsInfoSidecar() = default;

    // Missing file -> empty index. An unreadable or malformed file is logged
    // and also yields an empty index.
    static PathsInfoSidecar load(const std::filesystem::path& repo_root);

    // Only {"entries": [...]} objects with "type": "file" and a string "path"
    // are indexed.
    static PathsInfoSidecar fromJson(const nlohmann::json& doc);

    const SidecarEntry* find(const std::string& relative_path) const;

    // Entry whose digests may be reported for a file of `on_disk_size` bytes:
    // sizes agree and both digests are present.
    const SidecarEntry* trusted(const std::string& relative_path, uint64_t on_disk_size) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, SidecarEntry> entries_;
};

// Sidecar document describing `files` (absolute paths under `root`) as they
// are on disk. Files that no longer exist are skipped. Throws IoError when a
// file cannot be hashed.
nlohmann::json buildSidecarJson(const std::filesystem::path& root, const std::vector<std::filesystem::path>& files,
                                HashCache& hash_cache);

// Writes buildSidecarJson() to <root>/.paths-info.json. Returns the sidecar
// path, or nullopt when there is nothing to describe. With dry_run the path
// is returned without writing. Throws IoError on write failure.
std::optional<std::filesystem::path> writePathsInfoSidecar(const std::filesystem::path& root,
                                                           const std::vector<std::filesystem::path>& files,
                                                           HashCache& hash_cache, bool dry_run = false);

}  // namespace fakehub
