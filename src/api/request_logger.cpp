#include "api/request_logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <spdlog/spdlog.h>

namespace fakehub {

namespace {

thread_local std::chrono::steady_clock::time_point t_request_started{};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_sensitive_header(const std::string& name) {
    static const char* kSensitive[] = {"authorization", "cookie", "set-cookie", "proxy-authorization",
                                       "x-api-key", "x-hf-token"};
    const std::string key = lower(name);
    return std::any_of(std::begin(kSensitive), std::end(kSensitive),
                       [&key](const char* s) { return key == s; });
}

std::string header_or_dash(const httplib::Headers& headers, const char* name) {
    auto it = headers.find(name);
    return it == headers.end() ? "-" : it->second;
}

std::string dump_for_log(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

RequestLogger::RequestLogger(RequestLogConfig config) : config_(std::move(config)) {}

std::string RequestLogger::redact(const std::string& name, const std::string& value) const {
    if (config_.redact && is_sensitive_header(name)) return "***";
    return value;
}

nlohmann::json RequestLogger::headerSnapshot(const httplib::Headers& headers) const {
    nlohmann::json snapshot = nlohmann::json::object();
    if (config_.headers_mode == "all") {
        for (const auto& [name, value] : headers) {
            snapshot[lower(name)] = redact(name, value);
        }
        return snapshot;
    }
    for (const char* name : {"user-agent", "content-type", "range", "content-length", "accept", "referer",
                             "origin"}) {
        snapshot[name] = header_or_dash(headers, name);
    }
    return snapshot;
}

std::optional<std::string> RequestLogger::bodySnippet(const httplib::Request& req) const {
    if (req.body.empty()) return std::nullopt;
    const bool json_body = lower(req.get_header_value("Content-Type")).find("application/json") != std::string::npos;
    if (!config_.body_all && !json_body) return std::nullopt;
    return req.body.substr(0, config_.body_max);
}

void RequestLogger::onRequest(const httplib::Request& req, const std::string& request_id) const {
    t_request_started = std::chrono::steady_clock::now();
    if (!config_.enabled) return;

    std::string query;
    for (const auto& [key, value] : req.params) {
        query += query.empty() ? "?" : "&";
        query += key + "=" + value;
    }
    spdlog::info("[{}] HTTP {} {}{} from {}:{} proto={}", request_id, req.method, req.path, query,
                 req.remote_addr.empty() ? "-" : req.remote_addr, req.remote_port, req.version);
    spdlog::info("[{}] Headers: {}", request_id, dump_for_log(headerSnapshot(req.headers)));
}

void RequestLogger::onResponse(const httplib::Request& req, const httplib::Response& res) const {
    if (!config_.enabled) return;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t_request_started);
    const std::string request_id = res.get_header_value("X-Request-Id");

    // The body is read after pre-routing, so it is logged here.
    if (auto body = bodySnippet(req)) {
        spdlog::info("[{}] Body[<={}]: {}", request_id, config_.body_max, *body);
    }

    spdlog::info("[{}] Response {} {} -> {} ({} ms) ct={} len={}", request_id, req.method, req.path, res.status,
                 elapsed.count(), header_or_dash(res.headers, "Content-Type"),
                 header_or_dash(res.headers, "Content-Length"));
    if (config_.response_headers) {
        nlohmann::json snapshot = nlohmann::json::object();
        for (const auto& [name, value] : res.headers) {
            snapshot[name] = redact(name, value);
        }
        spdlog::info("[{}] Response headers: {}", request_id, dump_for_log(snapshot));
    }
}

}  // namespace fakehub
