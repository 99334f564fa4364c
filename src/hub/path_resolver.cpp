#include "hub/path_resolver.h"

#include <cctype>
#include <system_error>

#include "hub/hub_error.h"

namespace fs = std::filesystem;

namespace fakehub {

namespace {

fs::path stripTrailingSeparator(fs::path p) {
    if (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

std::string stripForJoin(const std::string& relative_path) {
    size_t b = 0;
    size_t e = relative_path.size();
    while (b < e && std::isspace(static_cast<unsigned char>(relative_path[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(relative_path[e - 1]))) --e;
    while (b < e && relative_path[b] == '/') ++b;
    return relative_path.substr(b, e - b);
}

}  // namespace

const char* to_string(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::Ok:
            return "ok";
        case ResolveStatus::NotFound:
            return "not_found";
        case ResolveStatus::OutOfBounds:
            return "out_of_bounds";
    }
    return "unknown";
}

std::string PathResolver::normalizeRelative(const std::string& relative_path) {
    const std::string stripped = stripForJoin(relative_path);
    if (stripped.empty()) return "";
    fs::path normal = stripTrailingSeparator(fs::path(stripped).lexically_normal());
    std::string out = normal.generic_string();
    if (out == ".") return "";
    return out;
}

fs::path PathResolver::absoluteRoot(const fs::path& root) {
    std::error_code ec;
    fs::path abs = fs::absolute(root, ec);
    if (ec) abs = root;
    return stripTrailingSeparator(abs.lexically_normal());
}

bool PathResolver::isWithin(const fs::path& root, const fs::path& target) {
    const fs::path r = stripTrailingSeparator(root.lexically_normal());
    const fs::path t = stripTrailingSeparator(target.lexically_normal());
    auto rit = r.begin();
    auto tit = t.begin();
    for (; rit != r.end(); ++rit, ++tit) {
        if (tit == t.end() || *rit != *tit) return false;
    }
    return true;
}

ResolveResult PathResolver::locate(const fs::path& root, const std::string& relative_path) {
    const fs::path abs_root = absoluteRoot(root);
    const std::string rel = stripForJoin(relative_path);
    fs::path target = rel.empty() ? abs_root : stripTrailingSeparator((abs_root / rel).lexically_normal());
    if (!isWithin(abs_root, target)) {
        return ResolveResult{ResolveStatus::OutOfBounds, {}};
    }
    return ResolveResult{ResolveStatus::Ok, target};
}

ResolveResult PathResolver::resolve(const fs::path& root, const std::string& relative_path) {
    ResolveResult located = locate(root, relative_path);
    if (!located.ok()) return located;
    std::error_code ec;
    if (!fs::exists(located.path, ec) || ec) {
        return ResolveResult{ResolveStatus::NotFound, {}};
    }
    return located;
}

fs::path PathResolver::resolveOrThrow(const fs::path& root, const std::string& relative_path) {
    ResolveResult result = resolve(root, relative_path);
    switch (result.status) {
        case ResolveStatus::Ok:
            return result.path;
        case ResolveStatus::OutOfBounds:
            throw OutOfBoundsError("path escapes repository root");
        case ResolveStatus::NotFound:
            break;
    }
    throw NotFoundError("entry not found");
}

}  // namespace fakehub
