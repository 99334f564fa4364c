#pragma once

#include <string>

namespace fakehub {

// Percent-encode one path segment (RFC 3986 unreserved characters kept).
inline std::string urlEncodePathSegment(const std::string& input) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        const bool unreserved =
            (c >= 'A' && c <= 'Z') ||
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[(c >> 4) & 0x0F]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// Encode each '/'-separated segment of a repository id, keeping the separators.
inline std::string urlEncodeRepoPath(const std::string& repo_id) {
    std::string out;
    size_t start = 0;
    while (true) {
        const size_t slash = repo_id.find('/', start);
        out += urlEncodePathSegment(repo_id.substr(start, slash == std::string::npos ? std::string::npos
                                                                                      : slash - start));
        if (slash == std::string::npos) break;
        out.push_back('/');
        start = slash + 1;
    }
    return out;
}

}  // namespace fakehub
