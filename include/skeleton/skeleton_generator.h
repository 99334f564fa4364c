#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "skeleton/tree_fetcher.h"

namespace fakehub {

constexpr uint64_t kDefaultFillSize = 16ull * 1024 * 1024;
constexpr size_t kFillChunkBytes = 1024 * 1024;

// fnmatch(3) semantics without FNM_PATHNAME: '*' also matches '/'.
bool globMatch(const std::string& pattern, const std::string& path);

// Keep items matching any include (all when none given) and no exclude,
// then cut to max_files when it is non-negative.
std::vector<TreeItem> applyFilters(const std::vector<TreeItem>& items, const std::vector<std::string>& includes,
                                   const std::vector<std::string>& excludes,
                                   std::optional<long long> max_files = std::nullopt);

// "1024", "64kb", "16MB" (10^3 units), "16MiB"/"16Mi" (2^10 units).
// Digits stop at '.' or ','. Throws std::invalid_argument.
uint64_t parseSize(const std::string& text);

// root / relative_path, rejecting anything outside root with
// std::invalid_argument("Suspicious path outside root: ...").
std::filesystem::path safeJoin(const std::filesystem::path& root, const std::string& relative_path);

// Existing files are left alone unless force. Throws IoError.
void touchEmptyFile(const std::filesystem::path& path, bool force);

// `pattern` repeated up to size_bytes (zero bytes for an empty pattern),
// written in chunks of at most kFillChunkBytes. Throws IoError.
void writeFilledFile(const std::filesystem::path& path, uint64_t size_bytes, const std::string& pattern, bool force);

struct GenerateOptions {
    bool force{false};
    bool dry_run{false};
    std::optional<uint64_t> fill_size;  // unset: empty files
    std::string fill_pattern;
};

struct SkeletonResult {
    std::filesystem::path root;
    std::vector<std::filesystem::path> created;  // absolute, in item order
};

// Creates one file per item under root. A dry run only computes the paths.
// Throws std::invalid_argument for escaping item paths and IoError.
SkeletonResult generateSkeleton(const std::filesystem::path& root, const std::vector<TreeItem>& items,
                                const GenerateOptions& options);

}  // namespace fakehub
