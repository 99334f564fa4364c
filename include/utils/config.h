#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace fakehub {

struct RequestLogConfig {
    bool enabled{true};
    size_t body_max{4096};
    std::string headers_mode{"all"};  // "all" | "minimal"
    bool response_headers{true};
    bool redact{true};
    bool body_all{true};  // false: only JSON request bodies
};

struct HubConfig {
    std::string hub_root{"fake_hub"};
    int port{8000};
    std::string bind_address{"0.0.0.0"};
    int worker_threads{8};
    bool probe_etag{true};
    bool paths_info_digests{true};
    std::string hash_cache{"memory"};  // "memory" | "none"
    size_t stream_chunk_bytes{8192};
    size_t hash_chunk_bytes{1024 * 1024};
    RequestLogConfig request_log;
};

// Defaults, then the JSON file (FAKEHUB_CONFIG or ~/.fakehub/config.json),
// then environment variables. Invalid values keep the previous setting.
HubConfig loadHubConfig();

// Same as loadHubConfig(), plus a one-line summary of the sources used.
std::pair<HubConfig, std::string> loadHubConfigWithLog();

// "0", "false" and "False" are false; anything else is true.
bool parseEnvFlag(const std::string& value);

}  // namespace fakehub
