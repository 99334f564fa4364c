#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include "utils/file_lock.h"

namespace fakehub {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

/// Get environment variable with fallback to deprecated name
/// Logs a warning if the deprecated name is used
std::optional<std::string> getEnvWithFallback(const char* new_name, const char* old_name) {
    if (auto v = getEnvValue(new_name)) {
        return v;
    }
    if (auto v = getEnvValue(old_name)) {
        spdlog::warn("Environment variable '{}' is deprecated, use '{}' instead", old_name, new_name);
        return v;
    }
    return std::nullopt;
}

std::optional<long long> parseInteger(const std::string& text) {
    try {
        size_t pos = 0;
        long long v = std::stoll(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool validHeadersMode(const std::string& mode) { return mode == "all" || mode == "minimal"; }
bool validHashCacheMode(const std::string& mode) { return mode == "memory" || mode == "none"; }

std::filesystem::path defaultConfigPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (!home.empty()) return home / ".fakehub/config.json";
    return std::filesystem::path();
}

bool readJsonWithLock(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    FileLock lock(path);
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    out = nlohmann::json::parse(text, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Ignoring malformed config file: {}", path.string());
        return false;
    }
    return true;
}

void applyJson(HubConfig& cfg, const nlohmann::json& j) {
    if (j.contains("hub_root") && j["hub_root"].is_string()) {
        cfg.hub_root = j["hub_root"].get<std::string>();
    }
    if (j.contains("port") && j["port"].is_number_integer()) {
        // Wide read first: get<int>() would wrap out-of-range values into range.
        auto v = j["port"].get<int64_t>();
        if (v > 0 && v < 65536) cfg.port = static_cast<int>(v);
    }
    if (j.contains("bind_address") && j["bind_address"].is_string()) {
        cfg.bind_address = j["bind_address"].get<std::string>();
    }
    if (j.contains("worker_threads") && j["worker_threads"].is_number_integer()) {
        auto v = j["worker_threads"].get<int64_t>();
        if (v > 0 && v <= 1024) cfg.worker_threads = static_cast<int>(v);
    }
    if (j.contains("probe_etag") && j["probe_etag"].is_boolean()) {
        cfg.probe_etag = j["probe_etag"].get<bool>();
    }
    if (j.contains("paths_info_digests") && j["paths_info_digests"].is_boolean()) {
        cfg.paths_info_digests = j["paths_info_digests"].get<bool>();
    }
    if (j.contains("hash_cache") && j["hash_cache"].is_string()) {
        auto mode = toLower(j["hash_cache"].get<std::string>());
        if (validHashCacheMode(mode)) cfg.hash_cache = mode;
    }
    if (j.contains("stream_chunk_bytes") && j["stream_chunk_bytes"].is_number_unsigned()) {
        auto v = j["stream_chunk_bytes"].get<size_t>();
        if (v > 0) cfg.stream_chunk_bytes = v;
    }
    if (j.contains("hash_chunk_bytes") && j["hash_chunk_bytes"].is_number_unsigned()) {
        auto v = j["hash_chunk_bytes"].get<size_t>();
        if (v > 0) cfg.hash_chunk_bytes = v;
    }

    auto& log = cfg.request_log;
    if (j.contains("log_requests") && j["log_requests"].is_boolean()) {
        log.enabled = j["log_requests"].get<bool>();
    }
    if (j.contains("log_body_max") && j["log_body_max"].is_number_unsigned()) {
        log.body_max = j["log_body_max"].get<size_t>();
    }
    if (j.contains("log_headers") && j["log_headers"].is_string()) {
        auto mode = toLower(j["log_headers"].get<std::string>());
        if (validHeadersMode(mode)) log.headers_mode = mode;
    }
    if (j.contains("log_response_headers") && j["log_response_headers"].is_boolean()) {
        log.response_headers = j["log_response_headers"].get<bool>();
    }
    if (j.contains("log_redact") && j["log_redact"].is_boolean()) {
        log.redact = j["log_redact"].get<bool>();
    }
    if (j.contains("log_body_all") && j["log_body_all"].is_boolean()) {
        log.body_all = j["log_body_all"].get<bool>();
    }
}

}  // namespace

bool parseEnvFlag(const std::string& value) {
    return !(value == "0" || value == "false" || value == "False");
}

std::pair<HubConfig, std::string> loadHubConfigWithLog() {
    HubConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // file
    std::filesystem::path cfg_path;
    if (auto env = getEnvValue("FAKEHUB_CONFIG")) {
        cfg_path = *env;
    } else {
        cfg_path = defaultConfigPath();
    }

    if (!cfg_path.empty()) {
        nlohmann::json j;
        if (readJsonWithLock(cfg_path, j)) {
            applyJson(cfg, j);
            log << "file=" << cfg_path << " ";
            used_file = true;
        }
    }

    // env overrides; FAKE_HUB_ROOT is the deprecated name of the root
    if (auto v = getEnvWithFallback("FAKEHUB_ROOT", "FAKE_HUB_ROOT")) {
        if (!v->empty()) {
            cfg.hub_root = *v;
            log << "env:ROOT=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("FAKEHUB_PORT")) {
        auto port = parseInteger(*v);
        if (port && *port > 0 && *port < 65536) {
            cfg.port = static_cast<int>(*port);
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("FAKEHUB_BIND_ADDRESS")) {
        if (!v->empty()) {
            cfg.bind_address = *v;
            log << "env:BIND_ADDRESS=" << *v << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("FAKEHUB_WORKER_THREADS")) {
        auto n = parseInteger(*v);
        if (n && *n > 0 && *n <= 1024) {
            cfg.worker_threads = static_cast<int>(*n);
            log << "env:WORKER_THREADS=" << cfg.worker_threads << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("FAKEHUB_PROBE_ETAG")) {
        cfg.probe_etag = parseEnvFlag(*v);
        log << "env:PROBE_ETAG=" << cfg.probe_etag << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("FAKEHUB_PATHS_INFO_DIGESTS")) {
        cfg.paths_info_digests = parseEnvFlag(*v);
        log << "env:PATHS_INFO_DIGESTS=" << cfg.paths_info_digests << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("FAKEHUB_HASH_CACHE")) {
        auto mode = toLower(*v);
        if (validHashCacheMode(mode)) {
            cfg.hash_cache = mode;
            log << "env:HASH_CACHE=" << mode << " ";
            used_env = true;
        }
    }

    auto& req_log = cfg.request_log;
    if (auto v = getEnvValue("LOG_REQUESTS")) {
        req_log.enabled = parseEnvFlag(*v);
        log << "env:LOG_REQUESTS=" << req_log.enabled << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LOG_BODY_MAX")) {
        auto n = parseInteger(*v);
        if (n && *n >= 0) {
            req_log.body_max = static_cast<size_t>(*n);
            log << "env:LOG_BODY_MAX=" << req_log.body_max << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("LOG_HEADERS")) {
        auto mode = toLower(*v);
        if (validHeadersMode(mode)) {
            req_log.headers_mode = mode;
            log << "env:LOG_HEADERS=" << mode << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("LOG_RESP_HEADERS")) {
        req_log.response_headers = parseEnvFlag(*v);
        log << "env:LOG_RESP_HEADERS=" << req_log.response_headers << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LOG_REDACT")) {
        req_log.redact = parseEnvFlag(*v);
        log << "env:LOG_REDACT=" << req_log.redact << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LOG_BODY_ALL")) {
        req_log.body_all = parseEnvFlag(*v);
        log << "env:LOG_BODY_ALL=" << req_log.body_all << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

HubConfig loadHubConfig() {
    auto info = loadHubConfigWithLog();
    return info.first;
}

}  // namespace fakehub
