// HubStorage - on-disk layout of the fixture hub
//   <hub_root>/<repo_id>/...           models
//   <hub_root>/datasets/<repo_id>/...  datasets
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fakehub {

enum class RepoKind {
    Model,
    Dataset,
};

const char* to_string(RepoKind kind);
std::optional<RepoKind> parseRepoKind(const std::string& text);

// Sidecar index written by the skeleton tool next to the repository files.
constexpr const char* kPathsInfoSidecarName = ".paths-info.json";

struct RepoFile {
    std::string relative_path;  // posix style
    uint64_t size_bytes{0};
};

class HubStorage {
public:
    explicit HubStorage(std::string hub_root);

    const std::string& hubRoot() const { return hub_root_; }

    // Directory a repository maps to, without checking that it exists.
    // Throws OutOfBoundsError when the id would leave the hub root.
    std::filesystem::path repoDir(RepoKind kind, const std::string& repo_id) const;

    // Existing repository directory. Throws NotFoundError / OutOfBoundsError.
    std::filesystem::path repoRoot(RepoKind kind, const std::string& repo_id) const;

    // Existing repository directory addressed verbatim relative to the hub
    // root (content routes: "org/name" or "datasets/org/name").
    std::filesystem::path contentRoot(const std::string& repo_path) const;

    bool repoExists(RepoKind kind, const std::string& repo_id) const;

    // Recursive regular-file listing sorted by path. The sidecar index at the
    // top of `root` is not part of the listing.
    static std::vector<RepoFile> walkFiles(const std::filesystem::path& root);

    // Like walkFiles(), with paths still reported relative to `base`.
    static std::vector<RepoFile> walkFiles(const std::filesystem::path& base,
                                           const std::filesystem::path& subdir);

    static uint64_t usedStorage(const std::vector<RepoFile>& files);

private:
    std::string hub_root_;
};

}  // namespace fakehub
