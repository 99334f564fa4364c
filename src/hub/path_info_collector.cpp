#include "hub/path_info_collector.h"

#include <set>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "hub/hub_storage.h"
#include "hub/path_resolver.h"
#include "hub/paths_info_sidecar.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fakehub {

const char* to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::File:
            return "file";
        case EntryKind::Directory:
            return "directory";
    }
    return "unknown";
}

json toJson(const FileRecord& record) {
    json j = {{"path", record.path}, {"type", to_string(record.kind)}};
    if (record.kind != EntryKind::File) return j;
    j["size"] = record.size_bytes;
    if (record.oid) j["oid"] = *record.oid;
    if (record.lfs_oid) {
        j["lfs"] = {{"oid", *record.lfs_oid}, {"size", record.size_bytes}};
    }
    return j;
}

json toJson(const std::vector<FileRecord>& records) {
    json out = json::array();
    for (const auto& record : records) out.push_back(toJson(record));
    return out;
}

PathsInfoQuery PathsInfoQuery::fromBody(const std::string& body) {
    PathsInfoQuery query;
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return query;

    auto paths = j.find("paths");
    if (paths != j.end() && paths->is_array()) {
        for (const auto& item : *paths) {
            if (item.is_string()) query.paths.push_back(item.get<std::string>());
        }
    }
    auto expand = j.find("expand");
    if (expand != j.end() && expand->is_boolean()) {
        query.expand = expand->get<bool>();
    }
    return query;
}

PathInfoCollector::PathInfoCollector(HashCache& hash_cache, bool compute_digests)
    : hash_cache_(hash_cache), compute_digests_(compute_digests) {}

FileRecord PathInfoCollector::fileRecord(const fs::path& absolute_path, const std::string& relative_path,
                                         uint64_t size_bytes, const PathsInfoSidecar& sidecar) const {
    FileRecord record;
    record.path = relative_path;
    record.kind = EntryKind::File;
    record.size_bytes = size_bytes;

    if (const SidecarEntry* entry = sidecar.trusted(relative_path, size_bytes)) {
        record.oid = entry->oid;
        record.lfs_oid = entry->lfs_oid;
        return record;
    }
    if (!compute_digests_) return record;

    try {
        const FileDigests digests = hash_cache_.digest(absolute_path);
        record.oid = digests.sha1;
        record.lfs_oid = "sha256:" + digests.sha256;
    } catch (const IoError& e) {
        spdlog::warn("PathInfoCollector: digests unavailable for {}: {}", relative_path, e.what());
    }
    return record;
}

std::vector<FileRecord> PathInfoCollector::collectWith(const fs::path& base_dir,
                                                       const std::optional<std::string>& relative_prefix,
                                                       const PathsInfoSidecar& sidecar) const {
    std::vector<FileRecord> out;
    const fs::path base = PathResolver::absoluteRoot(base_dir);
    const std::string rel = relative_prefix ? PathResolver::normalizeRelative(*relative_prefix) : "";

    fs::path walk_dir = base;
    if (!rel.empty()) {
        const ResolveResult target = PathResolver::resolve(base, rel);
        if (!target.ok()) return out;

        std::error_code ec;
        if (fs::is_regular_file(target.path, ec)) {
            if (rel == kPathsInfoSidecarName) return out;
            const auto size = fs::file_size(target.path, ec);
            if (ec) return out;
            out.push_back(fileRecord(target.path, rel, static_cast<uint64_t>(size), sidecar));
            return out;
        }
        if (!fs::is_directory(target.path, ec)) return out;
        out.push_back(FileRecord{rel, EntryKind::Directory, 0, std::nullopt, std::nullopt});
        walk_dir = target.path;
    }

    for (const auto& file : HubStorage::walkFiles(base, walk_dir)) {
        out.push_back(fileRecord(base / file.relative_path, file.relative_path, file.size_bytes, sidecar));
    }
    return out;
}

std::vector<FileRecord> PathInfoCollector::describeWith(const fs::path& base_dir, const std::string& relative_path,
                                                        const PathsInfoSidecar& sidecar) const {
    const std::string rel = PathResolver::normalizeRelative(relative_path);
    if (rel.empty()) {
        return {FileRecord{"", EntryKind::Directory, 0, std::nullopt, std::nullopt}};
    }
    const ResolveResult target = PathResolver::resolve(base_dir, rel);
    if (!target.ok()) return {};

    std::error_code ec;
    if (fs::is_directory(target.path, ec)) {
        return {FileRecord{rel, EntryKind::Directory, 0, std::nullopt, std::nullopt}};
    }
    if (fs::is_regular_file(target.path, ec) && rel != kPathsInfoSidecarName) {
        const auto size = fs::file_size(target.path, ec);
        if (ec) return {};
        return {fileRecord(target.path, rel, static_cast<uint64_t>(size), sidecar)};
    }
    return {};
}

std::vector<FileRecord> PathInfoCollector::collect(const fs::path& base_dir,
                                                   const std::optional<std::string>& relative_prefix) const {
    const PathsInfoSidecar sidecar = PathsInfoSidecar::load(base_dir);
    return collectWith(base_dir, relative_prefix, sidecar);
}

std::vector<FileRecord> PathInfoCollector::describe(const fs::path& base_dir, const std::string& relative_path) const {
    const PathsInfoSidecar sidecar = PathsInfoSidecar::load(base_dir);
    return describeWith(base_dir, relative_path, sidecar);
}

std::vector<FileRecord> PathInfoCollector::query(const fs::path& base_dir, const PathsInfoQuery& query) const {
    const PathsInfoSidecar sidecar = PathsInfoSidecar::load(base_dir);
    if (query.paths.empty()) {
        return collectWith(base_dir, std::nullopt, sidecar);
    }

    std::vector<FileRecord> results;
    for (const auto& path : query.paths) {
        std::vector<FileRecord> part = query.expand ? collectWith(base_dir, path, sidecar)
                                                    : describeWith(base_dir, path, sidecar);
        results.insert(results.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return dedup(std::move(results));
}

std::vector<FileRecord> PathInfoCollector::dedup(std::vector<FileRecord> records) {
    std::set<std::pair<std::string, EntryKind>> seen;
    std::vector<FileRecord> unique;
    unique.reserve(records.size());
    for (auto& record : records) {
        if (!seen.emplace(record.path, record.kind).second) continue;
        unique.push_back(std::move(record));
    }
    return unique;
}

}  // namespace fakehub
