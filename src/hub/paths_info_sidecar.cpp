#include "hub/paths_info_sidecar.h"

#include <fstream>
#include <spdlog/spdlog.h>
#include <system_error>

#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "hub/hub_storage.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fakehub {

namespace {

std::optional<std::string> string_field(const json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}  // namespace

bool sizesAgree(const SidecarEntry& entry, uint64_t on_disk_size) {
    return entry.size.has_value() && *entry.size == on_disk_size;
}

PathsInfoSidecar PathsInfoSidecar::fromJson(const json& doc) {
    PathsInfoSidecar sidecar;
    if (!doc.is_object()) return sidecar;
    auto entries = doc.find("entries");
    if (entries == doc.end() || !entries->is_array()) return sidecar;

    for (const auto& item : *entries) {
        if (!item.is_object()) continue;
        if (string_field(item, "type") != std::optional<std::string>("file")) continue;
        auto path = string_field(item, "path");
        if (!path) continue;

        SidecarEntry entry;
        entry.path = *path;
        auto size = item.find("size");
        if (size != item.end() && size->is_number_unsigned()) {
            entry.size = size->get<uint64_t>();
        }
        entry.oid = string_field(item, "oid");
        auto lfs = item.find("lfs");
        if (lfs != item.end()) {
            entry.lfs_oid = string_field(*lfs, "oid");
        }
        sidecar.entries_[entry.path] = std::move(entry);
    }
    return sidecar;
}

PathsInfoSidecar PathsInfoSidecar::load(const fs::path& repo_root) {
    const fs::path path = repo_root / kPathsInfoSidecarName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) return {};

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        spdlog::warn("PathsInfoSidecar: cannot open {}", path.string());
        return {};
    }
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        spdlog::warn("PathsInfoSidecar: ignoring malformed {}", path.string());
        return {};
    }
    return fromJson(doc);
}

const SidecarEntry* PathsInfoSidecar::find(const std::string& relative_path) const {
    auto it = entries_.find(relative_path);
    return it == entries_.end() ? nullptr : &it->second;
}

const SidecarEntry* PathsInfoSidecar::trusted(const std::string& relative_path, uint64_t on_disk_size) const {
    const SidecarEntry* entry = find(relative_path);
    if (!entry) return nullptr;
    if (!sizesAgree(*entry, on_disk_size)) {
        spdlog::debug("PathsInfoSidecar: size mismatch for {}, recomputing", relative_path);
        return nullptr;
    }
    if (!entry->oid || !entry->lfs_oid) return nullptr;
    return entry;
}

json buildSidecarJson(const fs::path& root, const std::vector<fs::path>& files, HashCache& hash_cache) {
    json entries = json::array();
    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec) || ec) continue;
        const auto size = fs::file_size(file, ec);
        if (ec) continue;

        const FileDigests digests = hash_cache.digest(file);
        const auto size_bytes = static_cast<uint64_t>(size);
        entries.push_back({
            {"path", file.lexically_relative(root).generic_string()},
            {"type", "file"},
            {"size", size_bytes},
            {"oid", digests.sha1},
            {"etag", digests.sha1},
            {"lfs", {{"oid", "sha256:" + digests.sha256}, {"size", size_bytes}}},
        });
    }
    return json{{"version", 1}, {"entries", entries}};
}

std::optional<fs::path> writePathsInfoSidecar(const fs::path& root, const std::vector<fs::path>& files,
                                              HashCache& hash_cache, bool dry_run) {
    const json doc = buildSidecarJson(root, files, hash_cache);
    if (doc["entries"].empty()) return std::nullopt;

    const fs::path sidecar_path = root / kPathsInfoSidecarName;
    if (dry_run) return sidecar_path;

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw IoError("cannot create " + root.string() + ": " + ec.message());
    }
    const fs::path temp_path = sidecar_path.string() + ".tmp";
    {
        std::ofstream ofs(temp_path, std::ios::binary | std::ios::trunc);
        ofs << doc.dump(2);
        if (!ofs) {
            throw IoError("cannot write " + temp_path.string());
        }
    }
    fs::rename(temp_path, sidecar_path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(temp_path, ec);
        throw IoError("cannot replace " + sidecar_path.string() + ": " + reason);
    }
    return sidecar_path;
}

}  // namespace fakehub
