#pragma once

#include <httplib.h>
#include <optional>
#include <regex>
#include <string>

#include "hub/hub_storage.h"

namespace fakehub {

class FileServer;
class PathInfoCollector;
class RepoMetadataBuilder;
struct FileResponse;

/// Hub-compatible routes:
///   GET  /api/{models,datasets}/{repo_id}[/revision/{revision}]
///   POST /api/{models,datasets}/{repo_id}/paths-info/{revision}
///   GET|HEAD /{repo_path}/resolve/{revision}/{filename}
class HubEndpoints {
public:
    HubEndpoints(const HubStorage& storage, FileServer& file_server, PathInfoCollector& collector,
                 RepoMetadataBuilder& metadata);

    void registerRoutes(httplib::Server& server);

    // Serves a GET or HEAD whose path is a resolve route, without httplib's
    // router. Returns false for any other request.
    bool serveResolvePath(const httplib::Request& req, httplib::Response& res) const;

private:
    void handleInfo(RepoKind kind, const std::string& repo_id, const std::optional<std::string>& revision,
                    httplib::Response& res) const;
    void handlePathsInfo(RepoKind kind, const std::string& repo_id, const httplib::Request& req,
                         httplib::Response& res) const;
    void handleResolve(const httplib::Request& req, httplib::Response& res, const std::smatch& matches) const;
    void attachBody(const FileResponse& file, httplib::Response& res) const;

    const HubStorage& storage_;
    FileServer& file_server_;
    PathInfoCollector& collector_;
    RepoMetadataBuilder& metadata_;
};

}  // namespace fakehub
