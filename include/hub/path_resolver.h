#pragma once

#include <filesystem>
#include <string>

namespace fakehub {

enum class ResolveStatus {
    Ok,
    NotFound,
    OutOfBounds,
};

struct ResolveResult {
    ResolveStatus status{ResolveStatus::NotFound};
    std::filesystem::path path;  // absolute, normalized; set when status == Ok

    bool ok() const { return status == ResolveStatus::Ok; }
};

const char* to_string(ResolveStatus status);

// Maps repository-relative paths onto a root directory without ever leaving it.
// Existence is checked on every call; nothing is cached.
class PathResolver {
public:
    // Strip leading slashes and surrounding whitespace, collapse "." / "..",
    // and convert to forward slashes. "" denotes the root itself.
    static std::string normalizeRelative(const std::string& relative_path);

    // True when `target` equals `root` or lies below it, comparing
    // normalized components (not raw string prefixes).
    static bool isWithin(const std::filesystem::path& root, const std::filesystem::path& target);

    // Absolute, lexically normalized form of `root` without a trailing separator.
    static std::filesystem::path absoluteRoot(const std::filesystem::path& root);

    // Bounds check only; does not touch the filesystem.
    static ResolveResult locate(const std::filesystem::path& root, const std::string& relative_path);

    // Bounds check plus an existence check of the target.
    static ResolveResult resolve(const std::filesystem::path& root, const std::string& relative_path);

    // Like resolve(), throwing OutOfBoundsError / NotFoundError.
    static std::filesystem::path resolveOrThrow(const std::filesystem::path& root,
                                                const std::string& relative_path);
};

}  // namespace fakehub
