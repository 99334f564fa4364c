#include "api/hub_endpoints.h"

#include <algorithm>
#include <memory>
#include <nlohmann/json.hpp>
#include <regex>
#include <spdlog/spdlog.h>
#include <vector>

#include "hub/file_server.h"
#include "hub/hub_error.h"
#include "hub/path_info_collector.h"
#include "hub/repo_metadata.h"

namespace fakehub {

namespace {

void set_detail(httplib::Response& res, int status, const std::string& detail) {
    nlohmann::json body = {{"detail", detail}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

const char* not_found_detail(RepoKind kind) {
    return kind == RepoKind::Dataset ? "Dataset not found" : "Repository not found";
}

bool never_called(size_t, size_t, httplib::DataSink&) { return false; }

// repo path (lazy, so "/resolve/" splits at its first occurrence), revision, filename
constexpr const char* kResolvePattern = R"(/(.+?)/resolve/([^/]+)/(.+))";

}  // namespace

HubEndpoints::HubEndpoints(const HubStorage& storage, FileServer& file_server, PathInfoCollector& collector,
                           RepoMetadataBuilder& metadata)
    : storage_(storage), file_server_(file_server), collector_(collector), metadata_(metadata) {}

void HubEndpoints::registerRoutes(httplib::Server& server) {
    // Revision and paths-info routes go first: "(.+)" would swallow them.
    for (RepoKind kind : {RepoKind::Model, RepoKind::Dataset}) {
        const std::string prefix = kind == RepoKind::Model ? "/api/models/" : "/api/datasets/";

        server.Get(prefix + R"((.+)/revision/([^/]+))",
                   [this, kind](const httplib::Request& req, httplib::Response& res) {
                       handleInfo(kind, req.matches[1].str(), req.matches[2].str(), res);
                   });
        server.Post(prefix + R"((.+)/paths-info/([^/]+))",
                    [this, kind](const httplib::Request& req, httplib::Response& res) {
                        handlePathsInfo(kind, req.matches[1].str(), req, res);
                    });
        server.Get(prefix + R"((.+))", [this, kind](const httplib::Request& req, httplib::Response& res) {
            handleInfo(kind, req.matches[1].str(), std::nullopt, res);
        });
    }

    // GET and HEAD (httplib dispatches HEAD to GET handlers)
    server.Get(kResolvePattern, [this](const httplib::Request& req, httplib::Response& res) {
        handleResolve(req, res, req.matches);
    });
}

void HubEndpoints::handleInfo(RepoKind kind, const std::string& repo_id, const std::optional<std::string>& revision,
                              httplib::Response& res) const {
    try {
        nlohmann::json body = kind == RepoKind::Model ? metadata_.model(repo_id, revision)
                                                      : metadata_.dataset(repo_id, revision);
        res.set_content(body.dump(), "application/json");
    } catch (const NotFoundError& e) {
        spdlog::debug("HubEndpoints: {} {} not found: {}", to_string(kind), repo_id, e.what());
        set_detail(res, 404, not_found_detail(kind));
    }
}

void HubEndpoints::handlePathsInfo(RepoKind kind, const std::string& repo_id, const httplib::Request& req,
                                   httplib::Response& res) const {
    std::filesystem::path root;
    try {
        root = storage_.repoRoot(kind, repo_id);
    } catch (const NotFoundError& e) {
        spdlog::debug("HubEndpoints: paths-info for missing {} {}: {}", to_string(kind), repo_id, e.what());
        set_detail(res, 404, not_found_detail(kind));
        return;
    }

    const PathsInfoQuery query = PathsInfoQuery::fromBody(req.body);
    const std::vector<FileRecord> records = collector_.query(root, query);
    res.set_content(toJson(records).dump(), "application/json");
}

bool HubEndpoints::serveResolvePath(const httplib::Request& req, httplib::Response& res) const {
    static const std::regex resolve_re(kResolvePattern);
    if (req.method != "GET" && req.method != "HEAD") return false;
    std::smatch matches;
    if (!std::regex_match(req.path, matches, resolve_re)) return false;
    handleResolve(req, res, matches);
    return true;
}

void HubEndpoints::handleResolve(const httplib::Request& req, httplib::Response& res,
                                 const std::smatch& matches) const {
    FileRequest request;
    request.repo_path = matches[1].str();
    request.revision = matches[2].str();
    request.filename = matches[3].str();
    request.method = req.method == "HEAD" ? FileRequestMethod::Probe : FileRequestMethod::Content;
    if (req.has_header("Range")) {
        request.range_header = req.get_header_value("Range");
    }

    FileResponse file;
    try {
        file = file_server_.serve(request);
    } catch (const NotFoundError& e) {
        spdlog::debug("HubEndpoints: {} {}/{}: {}", req.method, request.repo_path, request.filename, e.what());
        res.status = 404;
        res.set_content("Entry not found", "text/plain");
        return;
    }

    res.status = file.status;
    for (const auto& [name, value] : file.headers) {
        res.set_header(name, value);
    }

    if (file.status == 416) return;

    if (!file.has_body) {
        // HEAD: httplib reports the provider length as Content-Length and never pulls the body.
        if (file.content_length > 0) {
            res.set_content_provider(static_cast<size_t>(file.content_length), file.content_type, never_called);
        } else {
            res.set_content("", file.content_type);
        }
        return;
    }
    attachBody(file, res);
}

void HubEndpoints::attachBody(const FileResponse& file, httplib::Response& res) const {
    if (file.content_length == 0) {
        res.set_content("", file.content_type);
        return;
    }

    // Opened before any header is written, so an open failure still becomes a 500.
    std::shared_ptr<ByteWindowReader> reader = file_server_.openBody(file);
    auto buffer = std::make_shared<std::vector<char>>(
        std::max<size_t>(1, file_server_.options().stream_chunk_bytes));
    const std::string name = file.path.filename().string();

    res.set_content_provider(
        static_cast<size_t>(file.content_length), file.content_type,
        [reader, buffer, name](size_t offset, size_t length, httplib::DataSink& sink) {
            const size_t n = reader->readAt(offset, buffer->data(), std::min(length, buffer->size()));
            if (n == 0) {
                // Aborts the connection instead of sending a short body.
                spdlog::error("HubEndpoints: read failed while streaming {} at offset {}", name,
                              reader->offset() + offset);
                return false;
            }
            return sink.write(buffer->data(), n);
        },
        [reader, name](bool success) {
            if (!success) {
                spdlog::debug("HubEndpoints: transfer of {} ended early", name);
            }
        });
}

}  // namespace fakehub
