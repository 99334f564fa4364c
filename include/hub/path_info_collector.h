#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fakehub {

class HashCache;
class PathsInfoSidecar;

enum class EntryKind {
    File,
    Directory,
};

const char* to_string(EntryKind kind);

struct FileRecord {
    std::string path;  // posix style, relative to the repository root
    EntryKind kind{EntryKind::File};
    uint64_t size_bytes{0};
    std::optional<std::string> oid;      // sha1 hex
    std::optional<std::string> lfs_oid;  // "sha256:<hex>"
};

nlohmann::json toJson(const FileRecord& record);
nlohmann::json toJson(const std::vector<FileRecord>& records);

// Body of a paths-info request. Anything unusable falls back to
// {paths: [], expand: true}, i.e. "list everything".
struct PathsInfoQuery {
    std::vector<std::string> paths;
    bool expand{true};

    static PathsInfoQuery fromBody(const std::string& body);
};

/// Enumerates repository entries for the paths-info endpoints.
///
/// Digests come from the repository's sidecar index when its entry is
/// trusted (see sizesAgree()), otherwise from the hash cache. With
/// compute_digests off, untrusted files are reported with their size only.
class PathInfoCollector {
public:
    explicit PathInfoCollector(HashCache& hash_cache, bool compute_digests = true);

    // Whole tree (prefix empty or root), a directory subtree preceded by its
    // own entry, or a single file. Missing or escaping prefixes yield nothing.
    std::vector<FileRecord> collect(const std::filesystem::path& base_dir,
                                    const std::optional<std::string>& relative_prefix = std::nullopt) const;

    // The entry itself without descending into directories.
    std::vector<FileRecord> describe(const std::filesystem::path& base_dir, const std::string& relative_path) const;

    // Full request evaluation, deduplicated.
    std::vector<FileRecord> query(const std::filesystem::path& base_dir, const PathsInfoQuery& query) const;

    // Keeps the first record for each (path, kind).
    static std::vector<FileRecord> dedup(std::vector<FileRecord> records);

private:
    std::vector<FileRecord> collectWith(const std::filesystem::path& base_dir,
                                        const std::optional<std::string>& relative_prefix,
                                        const PathsInfoSidecar& sidecar) const;
    std::vector<FileRecord> describeWith(const std::filesystem::path& base_dir, const std::string& relative_path,
                                         const PathsInfoSidecar& sidecar) const;
    FileRecord fileRecord(const std::filesystem::path& absolute_path, const std::string& relative_path,
                          uint64_t size_bytes, const PathsInfoSidecar& sidecar) const;

    HashCache& hash_cache_;
    bool compute_digests_{true};
};

}  // namespace fakehub
