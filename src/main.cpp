#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <signal.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

#include "api/http_server.h"
#include "api/hub_endpoints.h"
#include "api/request_logger.h"
#include "cli/commands.h"
#include "hub/file_server.h"
#include "hub/hash_cache.h"
#include "hub/hub_storage.h"
#include "hub/path_info_collector.h"
#include "hub/repo_metadata.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

void applyServeOptions(const fakehub::ServeOptions& options, fakehub::HubConfig& cfg) {
    if (options.port) cfg.port = *options.port;
    if (options.host) cfg.bind_address = *options.host;
    if (options.root) cfg.hub_root = *options.root;
    if (options.threads) cfg.worker_threads = *options.threads;
}

}  // namespace

int run_server(const fakehub::HubConfig& cfg, bool single_iteration) {
    fakehub::g_running_flag.store(true);

    try {
        std::error_code ec;
        const auto absolute_root = std::filesystem::absolute(cfg.hub_root, ec);
        spdlog::info("Hub root: {}", ec ? cfg.hub_root : absolute_root.string());
        if (!std::filesystem::is_directory(cfg.hub_root, ec)) {
            spdlog::warn("Hub root {} does not exist yet; every repository will be reported missing", cfg.hub_root);
        }

        fakehub::HubStorage storage(cfg.hub_root);
        auto hash_cache = fakehub::makeHashCache(cfg.hash_cache, cfg.hash_chunk_bytes);

        fakehub::FileServerOptions file_options;
        file_options.probe_etag = cfg.probe_etag;
        file_options.stream_chunk_bytes = cfg.stream_chunk_bytes;
        fakehub::FileServer file_server(storage, *hash_cache, file_options);
        fakehub::PathInfoCollector collector(*hash_cache, cfg.paths_info_digests);
        fakehub::RepoMetadataBuilder metadata(storage);
        fakehub::HubEndpoints endpoints(storage, file_server, collector, metadata);

        fakehub::RequestLogger request_logger(cfg.request_log);
        fakehub::HttpServer server(cfg.port, endpoints, cfg.bind_address, cfg.worker_threads);
        if (request_logger.enabled()) {
            server.addMiddleware([&request_logger](const httplib::Request& req, httplib::Response& res) {
                request_logger.onRequest(req, res.get_header_value("X-Request-Id"));
                return true;
            });
            server.setLogger([&request_logger](const httplib::Request& req, const httplib::Response& res) {
                request_logger.onResponse(req, res);
            });
        }

        std::cout << "Starting HTTP server on " << cfg.bind_address << ":" << cfg.port << "..." << std::endl;
        server.start();

        if (single_iteration) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            fakehub::request_shutdown();
        }
        while (fakehub::is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::cout << "Shutting down..." << std::endl;
        server.stop();
        spdlog::info("Served {} requests", fakehub::total_request_count());
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Server shutdown complete" << std::endl;
    return 0;
}

void signalHandler(int) {
    fakehub::request_shutdown();
}

#ifndef FAKEHUB_TESTING
int main(int argc, char* argv[]) {
    auto cli_result = fakehub::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    fakehub::logger::init_from_env();

    auto [cfg, config_log] = fakehub::loadHubConfigWithLog();
    spdlog::debug("Config: {}", config_log);

    switch (cli_result.subcommand) {
        case fakehub::Subcommand::Skeleton:
            return fakehub::cli::commands::skeleton(cli_result.skeleton_options, cfg);

        case fakehub::Subcommand::Serve:
        case fakehub::Subcommand::None:
        default:
            signal(SIGINT, signalHandler);
            signal(SIGTERM, signalHandler);
            spdlog::info("fakehub v{} starting...", FAKEHUB_VERSION);
            applyServeOptions(cli_result.serve_options, cfg);
            return run_server(cfg, /*single_iteration=*/false);
    }
}
#endif

#ifdef FAKEHUB_TESTING
extern "C" int fakehub_run_for_test() {
    auto cfg = fakehub::loadHubConfig();
    return run_server(cfg, /*single_iteration=*/true);
}
#endif
