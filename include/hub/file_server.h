#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "hub/byte_window_reader.h"
#include "hub/range_parser.h"

namespace fakehub {

class HashCache;
class HubStorage;

constexpr const char* kOctetStream = "application/octet-stream";

enum class FileRequestMethod {
    Probe,    // HEAD
    Content,  // GET
};

struct FileRequest {
    std::string repo_path;  // repository id as addressed in the URL ("gpt2", "datasets/org/name")
    std::string revision;
    std::string filename;
    FileRequestMethod method{FileRequestMethod::Content};
    std::optional<std::string> range_header;
};

struct FileServerOptions {
    // Compute a content digest for HEAD responses (reads the whole file on a cache miss).
    bool probe_etag{true};
    size_t stream_chunk_bytes{kDefaultStreamChunkBytes};
    // Suffixes that get the x-lfs-size hint and a sha256 ETag.
    std::vector<std::string> lfs_suffixes{".bin",  ".safetensors", ".gguf", ".pt",      ".pth",
                                          ".ckpt", ".onnx",        ".h5",   ".msgpack", ".parquet"};
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// Response shape decided for a file request. The body, if any, is the
/// inclusive window [body_offset, body_offset + content_length) of `path`;
/// the transport pulls it through openBody().
struct FileResponse {
    int status{200};
    std::string content_type{kOctetStream};
    HeaderList headers;  // everything except Content-Type / Content-Length
    uint64_t content_length{0};
    uint64_t total_size{0};
    bool has_body{false};
    std::filesystem::path path;
    uint64_t body_offset{0};
    RangeParseStatus range_status{RangeParseStatus::Malformed};

    std::optional<std::string> header(const std::string& name) const;
};

class FileServer {
public:
    FileServer(const HubStorage& storage, HashCache& hash_cache, FileServerOptions options = {});

    /// Decide the response for a file request. Throws NotFoundError (also for
    /// traversal attempts) and IoError.
    FileResponse serve(const FileRequest& request) const;

    /// Open the body window of a response. Throws IoError.
    std::unique_ptr<ByteWindowReader> openBody(const FileResponse& response) const;

    bool isLfsFilename(const std::string& filename) const;

    const FileServerOptions& options() const { return options_; }

private:
    FileResponse probe(const FileRequest& request, const std::filesystem::path& path, uint64_t size) const;
    FileResponse wholeFile(const FileRequest& request, const std::filesystem::path& path, uint64_t size) const;
    FileResponse partial(const FileRequest& request, const std::filesystem::path& path, uint64_t size,
                         const ByteRange& range) const;
    FileResponse unsatisfiable(uint64_t size) const;

    const HubStorage& storage_;
    HashCache& hash_cache_;
    FileServerOptions options_;
};

}  // namespace fakehub
