#include "hub/file_server.h"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <system_error>

#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "hub/hub_storage.h"
#include "hub/path_resolver.h"

namespace fs = std::filesystem;

namespace fakehub {

namespace {

bool ends_with_case_insensitive(const std::string& value, const std::string& suffix) {
    if (value.size() < suffix.size()) return false;
    const size_t offset = value.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        const auto lhs = static_cast<unsigned char>(value[offset + i]);
        const auto rhs = static_cast<unsigned char>(suffix[i]);
        if (std::tolower(lhs) != std::tolower(rhs)) return false;
    }
    return true;
}

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && ends_with_case_insensitive(a, b);
}

void addRevisionHeaders(HeaderList& headers, const std::string& revision) {
    headers.emplace_back("x-repo-commit", revision);
    headers.emplace_back("x-revision", revision);
}

std::string quoted(const std::string& value) { return "\"" + value + "\""; }

}  // namespace

std::optional<std::string> FileResponse::header(const std::string& name) const {
    if (iequals(name, "Content-Type")) return content_type;
    if (iequals(name, "Content-Length")) return std::to_string(content_length);
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) return value;
    }
    return std::nullopt;
}

FileServer::FileServer(const HubStorage& storage, HashCache& hash_cache, FileServerOptions options)
    : storage_(storage), hash_cache_(hash_cache), options_(std::move(options)) {}

bool FileServer::isLfsFilename(const std::string& filename) const {
    return std::any_of(options_.lfs_suffixes.begin(), options_.lfs_suffixes.end(),
                       [&filename](const std::string& suffix) {
                           return ends_with_case_insensitive(filename, suffix);
                       });
}

FileResponse FileServer::serve(const FileRequest& request) const {
    const fs::path root = storage_.contentRoot(request.repo_path);

    if (PathResolver::normalizeRelative(request.filename).empty()) {
        throw NotFoundError("Entry not found");
    }
    const fs::path path = PathResolver::resolveOrThrow(root, request.filename);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        throw NotFoundError("Entry not found");
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw NotFoundError("Entry not found");
    }
    const uint64_t total = static_cast<uint64_t>(size);

    if (request.method == FileRequestMethod::Probe) {
        return probe(request, path, total);
    }

    if (!request.range_header) {
        return wholeFile(request, path, total);
    }

    const RangeParseResult parsed = parseRange(*request.range_header, total);
    switch (parsed.status) {
        case RangeParseStatus::Satisfiable:
            return partial(request, path, total, parsed.range);
        case RangeParseStatus::Unsatisfiable:
            spdlog::debug("FileServer: unsatisfiable range '{}' for {} ({} bytes)", *request.range_header,
                          request.filename, total);
            return unsatisfiable(total);
        case RangeParseStatus::Malformed:
            break;
    }
    spdlog::debug("FileServer: ignoring malformed range '{}' for {}", *request.range_header,
                  request.filename);
    return wholeFile(request, path, total);
}

FileResponse FileServer::probe(const FileRequest& request, const fs::path& path, uint64_t size) const {
    FileResponse res;
    res.status = 200;
    res.total_size = size;
    res.content_length = size;
    res.path = path;
    res.headers.emplace_back("Accept-Ranges", "bytes");
    addRevisionHeaders(res.headers, request.revision);

    const bool lfs = isLfsFilename(request.filename);
    if (lfs) {
        res.headers.emplace_back("x-lfs-size", std::to_string(size));
    }
    if (options_.probe_etag) {
        const FileDigests digests = hash_cache_.digest(path);
        res.headers.emplace_back("ETag", quoted(lfs ? digests.sha256 : digests.sha1));
    }
    return res;
}

FileResponse FileServer::wholeFile(const FileRequest& request, const fs::path& path, uint64_t size) const {
    FileResponse res;
    res.status = 200;
    res.total_size = size;
    res.content_length = size;
    res.has_body = true;
    res.path = path;
    res.body_offset = 0;
    res.headers.emplace_back("Accept-Ranges", "bytes");
    addRevisionHeaders(res.headers, request.revision);
    res.headers.emplace_back("Content-Disposition",
                             "attachment; filename=\"" + path.filename().string() + "\"");
    return res;
}

FileResponse FileServer::partial(const FileRequest& request, const fs::path& path, uint64_t size,
                                 const ByteRange& range) const {
    FileResponse res;
    res.status = 206;
    res.range_status = RangeParseStatus::Satisfiable;
    res.total_size = size;
    res.content_length = range.length();
    res.has_body = true;
    res.path = path;
    res.body_offset = range.start;
    res.headers.emplace_back("Content-Range", contentRangeHeader(range, size));
    res.headers.emplace_back("Accept-Ranges", "bytes");
    addRevisionHeaders(res.headers, request.revision);
    return res;
}

FileResponse FileServer::unsatisfiable(uint64_t size) const {
    FileResponse res;
    res.status = 416;
    res.range_status = RangeParseStatus::Unsatisfiable;
    res.total_size = size;
    res.content_length = 0;
    res.has_body = false;
    res.headers.emplace_back("Content-Range", unsatisfiedContentRangeHeader(size));
    res.headers.emplace_back("Accept-Ranges", "bytes");
    return res;
}

std::unique_ptr<ByteWindowReader> FileServer::openBody(const FileResponse& response) const {
    if (!response.has_body) {
        throw IoError("response has no body");
    }
    return std::make_unique<ByteWindowReader>(response.path, response.body_offset, response.content_length);
}

}  // namespace fakehub
