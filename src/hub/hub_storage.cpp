#include "hub/hub_storage.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <system_error>

#include "hub/hub_error.h"
#include "hub/path_resolver.h"

namespace fs = std::filesystem;

namespace fakehub {

namespace {

bool is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

// Symlinked files count (fixture trees may link into a shared blob store).
bool is_regular_or_symlinked_file(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec) && !ec;
}

}  // namespace

const char* to_string(RepoKind kind) {
    switch (kind) {
        case RepoKind::Model:
            return "model";
        case RepoKind::Dataset:
            return "dataset";
    }
    return "unknown";
}

std::optional<RepoKind> parseRepoKind(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "model" || lower == "models") return RepoKind::Model;
    if (lower == "dataset" || lower == "datasets") return RepoKind::Dataset;
    return std::nullopt;
}

HubStorage::HubStorage(std::string hub_root) : hub_root_(std::move(hub_root)) {}

fs::path HubStorage::repoDir(RepoKind kind, const std::string& repo_id) const {
    const std::string rel = kind == RepoKind::Dataset ? "datasets/" + repo_id : repo_id;
    ResolveResult located = PathResolver::locate(hub_root_, rel);
    if (!located.ok()) {
        throw OutOfBoundsError("repository id escapes hub root");
    }
    return located.path;
}

fs::path HubStorage::repoRoot(RepoKind kind, const std::string& repo_id) const {
    if (PathResolver::normalizeRelative(repo_id).empty()) {
        throw NotFoundError(kind == RepoKind::Dataset ? "Dataset not found" : "Repository not found");
    }
    fs::path dir = repoDir(kind, repo_id);
    if (!fakehub::is_directory(dir)) {
        throw NotFoundError(kind == RepoKind::Dataset ? "Dataset not found" : "Repository not found");
    }
    return dir;
}

fs::path HubStorage::contentRoot(const std::string& repo_path) const {
    if (PathResolver::normalizeRelative(repo_path).empty()) {
        throw NotFoundError("Repository not found");
    }
    ResolveResult result = PathResolver::resolve(hub_root_, repo_path);
    if (result.status == ResolveStatus::OutOfBounds) {
        throw OutOfBoundsError("repository id escapes hub root");
    }
    if (!result.ok() || !fakehub::is_directory(result.path)) {
        throw NotFoundError("Repository not found");
    }
    return result.path;
}

bool HubStorage::repoExists(RepoKind kind, const std::string& repo_id) const {
    try {
        repoRoot(kind, repo_id);
        return true;
    } catch (const NotFoundError&) {
        return false;
    }
}

std::vector<RepoFile> HubStorage::walkFiles(const fs::path& root) {
    return walkFiles(root, root);
}

std::vector<RepoFile> HubStorage::walkFiles(const fs::path& base, const fs::path& subdir) {
    std::vector<RepoFile> out;
    const fs::path abs_base = PathResolver::absoluteRoot(base);
    const fs::path abs_dir = PathResolver::absoluteRoot(subdir);
    if (!fakehub::is_directory(abs_dir)) return out;

    std::error_code ec;
    fs::recursive_directory_iterator it(abs_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("HubStorage: cannot list {}: {}", abs_dir.string(), ec.message());
        return out;
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("HubStorage: walk error under {}: {}", abs_dir.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        if (!is_regular_or_symlinked_file(entry)) continue;

        const fs::path rel = entry.path().lexically_relative(abs_base);
        const std::string rel_str = rel.generic_string();
        if (rel_str == kPathsInfoSidecarName) continue;

        std::error_code size_ec;
        const auto size = fs::file_size(entry.path(), size_ec);
        if (size_ec) {
            spdlog::warn("HubStorage: cannot stat {}: {}", entry.path().string(), size_ec.message());
            continue;
        }
        out.push_back(RepoFile{rel_str, static_cast<uint64_t>(size)});
    }

    std::sort(out.begin(), out.end(),
              [](const RepoFile& a, const RepoFile& b) { return a.relative_path < b.relative_path; });
    return out;
}

uint64_t HubStorage::usedStorage(const std::vector<RepoFile>& files) {
    uint64_t total = 0;
    for (const auto& f : files) total += f.size_bytes;
    return total;
}

}  // namespace fakehub
