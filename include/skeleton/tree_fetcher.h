#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "hub/hub_storage.h"

namespace fakehub {

constexpr const char* kDefaultRemoteEndpoint = "https://huggingface.co";

struct TreeItem {
    std::string path;
    std::optional<uint64_t> size;
    std::optional<std::string> oid;      // git blob sha1
    std::optional<std::string> lfs_oid;  // "sha256:<hex>"
    std::optional<uint64_t> lfs_size;
};

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

// scheme://host[:port][/path]; an unparsable url yields empty scheme and host.
HttpUrl parseUrl(const std::string& url);

// HF_REMOTE_ENDPOINT or the public hub, without trailing slashes.
std::string defaultRemoteEndpoint();

// File entries of a tree listing: a JSON array, or an object holding the
// array under "tree", "items" or "paths". Directories are skipped.
std::vector<TreeItem> parseTreeListing(const nlohmann::json& listing);

/// Fetches repository listings from a remote hub without downloading content.
class TreeFetcher {
public:
    TreeFetcher(std::string endpoint, std::optional<std::string> token,
                std::chrono::milliseconds timeout = std::chrono::seconds(30));

    // Request path of the recursive tree listing (relative to the host).
    std::string treePath(RepoKind kind, const std::string& repo_id, const std::string& revision) const;

    // Throws std::runtime_error when the listing is unavailable or has no files.
    std::vector<TreeItem> fetch(RepoKind kind, const std::string& repo_id, const std::string& revision) const;

    const std::string& endpoint() const { return endpoint_; }

private:
    std::unique_ptr<httplib::Client> makeClient() const;

    std::string endpoint_;
    HttpUrl base_;
    std::optional<std::string> token_;
    std::chrono::milliseconds timeout_;
};

}  // namespace fakehub
