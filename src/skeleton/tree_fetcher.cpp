#include "skeleton/tree_fetcher.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <spdlog/spdlog.h>
#include <stdexcept>

#include "utils/url_encode.h"

using json = nlohmann::json;

namespace fakehub {

namespace {

std::string trimTrailingSlash(std::string value) {
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<std::string> stringField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<uint64_t> sizeField(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<uint64_t>();
}

const json* findItems(const json& listing) {
    if (listing.is_array()) return &listing;
    if (!listing.is_object()) return nullptr;
    for (const char* key : {"tree", "items", "paths"}) {
        auto it = listing.find(key);
        if (it != listing.end() && it->is_array()) return &*it;
    }
    return nullptr;
}

}  // namespace

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = toLowerAscii(match[1].str());
        parsed.host = match[2].str();
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

std::string defaultRemoteEndpoint() {
    if (const char* env = std::getenv("HF_REMOTE_ENDPOINT")) {
        if (*env) return trimTrailingSlash(env);
    }
    return kDefaultRemoteEndpoint;
}

std::vector<TreeItem> parseTreeListing(const json& listing) {
    std::vector<TreeItem> out;
    const json* items = findItems(listing);
    if (!items) return out;

    for (const auto& it : *items) {
        if (!it.is_object()) continue;
        auto path = stringField(it, "path");
        if (!path) path = stringField(it, "rfilename");
        auto type = stringField(it, "type");
        if (!type) type = stringField(it, "kind");
        if (!path || !type) continue;

        const std::string kind = toLowerAscii(*type);
        if (kind != "file" && kind != "blob") continue;

        TreeItem item;
        item.path = *path;
        item.size = sizeField(it, "size");
        item.oid = stringField(it, "oid");
        if (!item.oid) item.oid = stringField(it, "sha");
        auto lfs = it.find("lfs");
        if (lfs != it.end() && lfs->is_object()) {
            item.lfs_oid = stringField(*lfs, "oid");
            item.lfs_size = sizeField(*lfs, "size");
        }
        out.push_back(std::move(item));
    }
    return out;
}

TreeFetcher::TreeFetcher(std::string endpoint, std::optional<std::string> token, std::chrono::milliseconds timeout)
    : endpoint_(trimTrailingSlash(std::move(endpoint))), base_(parseUrl(endpoint_)), token_(std::move(token)),
      timeout_(timeout) {}

std::unique_ptr<httplib::Client> TreeFetcher::makeClient() const {
    if (base_.scheme.empty() || base_.host.empty()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (base_.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    // Build scheme://host:port format for Client's universal interface
    std::string scheme_host_port = base_.scheme + "://" + base_.host;
    if (base_.port != 0) {
        scheme_host_port += ":" + std::to_string(base_.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (client && client->is_valid()) {
        const int sec = static_cast<int>(timeout_.count() / 1000);
        const int usec = static_cast<int>((timeout_.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        client->set_follow_location(true);
        return client;
    }

    return nullptr;
}

std::string TreeFetcher::treePath(RepoKind kind, const std::string& repo_id, const std::string& revision) const {
    std::string path = trimTrailingSlash(base_.path);
    path += "/api/";
    path += kind == RepoKind::Model ? "models/" : "datasets/";
    path += urlEncodeRepoPath(repo_id);
    path += "/tree/" + urlEncodePathSegment(revision);
    path += "?recursive=1&expand=1";
    return path;
}

std::vector<TreeItem> TreeFetcher::fetch(RepoKind kind, const std::string& repo_id,
                                         const std::string& revision) const {
    const std::string unavailable = std::string(kind == RepoKind::Model ? "Model" : "Dataset") +
                                    " tree unavailable or empty for '" + repo_id + "' at " + revision + " (" +
                                    endpoint_ + ")";

    auto client = makeClient();
    if (!client) {
        throw std::runtime_error("cannot create HTTP client for endpoint '" + endpoint_ + "'");
    }

    const std::string path = treePath(kind, repo_id, revision);
    spdlog::info("TreeFetcher: GET {}{}", endpoint_, path);

    httplib::Headers headers;
    if (token_ && !token_->empty()) {
        headers.emplace("Authorization", "Bearer " + *token_);
    }
    auto res = client->Get(path.c_str(), headers);
    if (!res) {
        spdlog::warn("TreeFetcher: request failed ({})", httplib::to_string(res.error()));
        throw std::runtime_error(unavailable);
    }
    if (res->status != 200) {
        spdlog::warn("TreeFetcher: status={} for {}", res->status, path);
        throw std::runtime_error(unavailable);
    }

    auto listing = json::parse(res->body, nullptr, false);
    if (listing.is_discarded()) {
        spdlog::warn("TreeFetcher: response is not JSON ({} bytes)", res->body.size());
        throw std::runtime_error(unavailable);
    }
    auto items = parseTreeListing(listing);
    if (items.empty()) {
        throw std::runtime_error(unavailable);
    }
    spdlog::info("TreeFetcher: {} files listed", items.size());
    return items;
}

}  // namespace fakehub
