#include "skeleton/skeleton_generator.h"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>

#include "hub/hub_error.h"
#include "hub/path_resolver.h"

namespace fs = std::filesystem;

namespace fakehub {

namespace {

void ensureParent(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw IoError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
}

bool keepExisting(const fs::path& path, bool force) {
    std::error_code ec;
    return !force && fs::exists(path, ec);
}

uint64_t multiply(uint64_t n, uint64_t unit, const std::string& text) {
    if (unit != 0 && n > std::numeric_limits<uint64_t>::max() / unit) {
        throw std::invalid_argument("Size too large: " + text);
    }
    return n * unit;
}

}  // namespace

bool globMatch(const std::string& pattern, const std::string& path) {
    return ::fnmatch(pattern.c_str(), path.c_str(), 0) == 0;
}

std::vector<TreeItem> applyFilters(const std::vector<TreeItem>& items, const std::vector<std::string>& includes,
                                   const std::vector<std::string>& excludes, std::optional<long long> max_files) {
    std::vector<TreeItem> out;
    for (const auto& item : items) {
        if (!includes.empty() &&
            std::none_of(includes.begin(), includes.end(),
                         [&item](const std::string& pat) { return globMatch(pat, item.path); })) {
            continue;
        }
        if (std::any_of(excludes.begin(), excludes.end(),
                        [&item](const std::string& pat) { return globMatch(pat, item.path); })) {
            continue;
        }
        out.push_back(item);
    }
    if (max_files && *max_files >= 0 && out.size() > static_cast<size_t>(*max_files)) {
        out.resize(static_cast<size_t>(*max_files));
    }
    return out;
}

uint64_t parseSize(const std::string& text) {
    std::string s = text;
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return !std::isspace(c); }).base(), s.end());
    if (s.empty()) {
        throw std::invalid_argument("Empty size string");
    }

    std::string digits;
    std::string unit;
    for (char ch : s) {
        if (std::isdigit(static_cast<unsigned char>(ch))) {
            digits.push_back(ch);
        } else if (ch == '.' || ch == ',') {
            break;  // no fractions
        } else if (!std::isspace(static_cast<unsigned char>(ch))) {
            unit.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (digits.empty()) {
        throw std::invalid_argument("Invalid size: " + text);
    }

    uint64_t n = 0;
    try {
        n = std::stoull(digits);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Size too large: " + text);
    }

    if (unit.empty() || unit == "b") return n;
    if (unit == "kb") return multiply(n, 1000ull, text);
    if (unit == "mb") return multiply(n, 1000ull * 1000, text);
    if (unit == "gb") return multiply(n, 1000ull * 1000 * 1000, text);
    if (unit == "kib" || unit == "ki") return multiply(n, 1024ull, text);
    if (unit == "mib" || unit == "mi") return multiply(n, 1024ull * 1024, text);
    if (unit == "gib" || unit == "gi") return multiply(n, 1024ull * 1024 * 1024, text);
    throw std::invalid_argument("Unknown size unit in: " + text);
}

fs::path safeJoin(const fs::path& root, const std::string& relative_path) {
    const ResolveResult located = PathResolver::locate(root, relative_path);
    if (!located.ok()) {
        throw std::invalid_argument("Suspicious path outside root: " + relative_path);
    }
    return located.path;
}

void touchEmptyFile(const fs::path& path, bool force) {
    if (keepExisting(path, force)) return;
    ensureParent(path);
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw IoError("cannot create " + path.string());
    }
}

void writeFilledFile(const fs::path& path, uint64_t size_bytes, const std::string& pattern, bool force) {
    if (keepExisting(path, force)) return;
    ensureParent(path);

    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw IoError("cannot create " + path.string());
    }
    if (size_bytes == 0) return;

    const std::string pat = pattern.empty() ? std::string(1, '\0') : pattern;
    // Whole repetitions of the pattern so every chunk continues it seamlessly.
    const size_t reps = std::max<size_t>(1, kFillChunkBytes / pat.size());
    std::string chunk;
    chunk.reserve(reps * pat.size());
    for (size_t i = 0; i < reps; ++i) chunk += pat;
    if (chunk.size() > kFillChunkBytes) chunk.resize(kFillChunkBytes);

    uint64_t written = 0;
    while (size_bytes - written >= chunk.size()) {
        ofs.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        written += chunk.size();
    }
    const auto tail = static_cast<size_t>(size_bytes - written);
    if (tail > 0) {
        ofs.write(chunk.data(), static_cast<std::streamsize>(tail));
    }
    ofs.flush();
    if (!ofs) {
        throw IoError("short write to " + path.string());
    }
}

SkeletonResult generateSkeleton(const fs::path& root, const std::vector<TreeItem>& items,
                                const GenerateOptions& options) {
    SkeletonResult result;
    result.root = PathResolver::absoluteRoot(root);

    if (!options.dry_run) {
        std::error_code ec;
        fs::create_directories(result.root, ec);
        if (ec) {
            throw IoError("cannot create " + result.root.string() + ": " + ec.message());
        }
    }

    for (const auto& item : items) {
        const fs::path target = safeJoin(result.root, item.path);
        if (!options.dry_run) {
            if (options.fill_size) {
                writeFilledFile(target, *options.fill_size, options.fill_pattern, options.force);
            } else {
                touchEmptyFile(target, options.force);
            }
        }
        result.created.push_back(target);
    }
    return result;
}

}  // namespace fakehub
