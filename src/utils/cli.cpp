#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace fakehub {

namespace {

constexpr int kUsageErrorExit = 2;

// Helper to check for help flag in arguments
bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

std::optional<long long> parseInteger(const char* text) {
    try {
        size_t pos = 0;
        std::string s(text);
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

CliResult usageError(CliResult result, int exit_code, const std::string& message, const std::string& help) {
    result.should_exit = true;
    result.exit_code = exit_code;
    std::ostringstream oss;
    oss << "Error: " << message << "\n\n" << help;
    result.output = oss.str();
    return result;
}

CliResult parseServe(CliResult result, int argc, char* argv[], int start) {
    result.subcommand = Subcommand::Serve;

    if (hasHelpFlag(argc, argv, start)) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getServeHelpMessage();
        return result;
    }

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (std::strcmp(arg, "--port") == 0 && has_value) {
            auto v = parseInteger(argv[++i]);
            if (!v || *v <= 0 || *v > 65535) {
                return usageError(result, 1, std::string("invalid port: ") + argv[i], getServeHelpMessage());
            }
            result.serve_options.port = static_cast<uint16_t>(*v);
        } else if (std::strcmp(arg, "--host") == 0 && has_value) {
            result.serve_options.host = argv[++i];
        } else if (std::strcmp(arg, "--root") == 0 && has_value) {
            result.serve_options.root = argv[++i];
        } else if (std::strcmp(arg, "--threads") == 0 && has_value) {
            auto v = parseInteger(argv[++i]);
            if (!v || *v <= 0 || *v > 1024) {
                return usageError(result, 1, std::string("invalid thread count: ") + argv[i],
                                  getServeHelpMessage());
            }
            result.serve_options.threads = static_cast<int>(*v);
        } else {
            return usageError(result, 1, std::string("unexpected argument: ") + arg, getServeHelpMessage());
        }
    }
    return result;
}

CliResult parseSkeleton(CliResult result, int argc, char* argv[], int start) {
    result.subcommand = Subcommand::Skeleton;
    auto& opts = result.skeleton_options;

    if (hasHelpFlag(argc, argv, start)) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getSkeletonHelpMessage();
        return result;
    }

    auto is = [](const char* arg, const char* short_name, const char* long_name) {
        return (short_name && std::strcmp(arg, short_name) == 0) || std::strcmp(arg, long_name) == 0;
    };

    for (int i = start; i < argc; ++i) {
        const char* arg = argv[i];

        if (is(arg, nullptr, "--force")) {
            opts.force = true;
            continue;
        }
        if (is(arg, nullptr, "--dry-run")) {
            opts.dry_run = true;
            continue;
        }
        if (is(arg, nullptr, "--fill")) {
            opts.fill = true;
            continue;
        }

        const bool takes_value = is(arg, "-t", "--repo-type") || is(arg, "-r", "--revision") ||
                                 is(arg, "-e", "--endpoint") || is(arg, nullptr, "--token") ||
                                 is(arg, nullptr, "--include") || is(arg, nullptr, "--exclude") ||
                                 is(arg, nullptr, "--max-files") || is(arg, nullptr, "--dst") ||
                                 is(arg, nullptr, "--fill-size") || is(arg, nullptr, "--fill-content");
        if (takes_value) {
            if (i + 1 >= argc) {
                return usageError(result, kUsageErrorExit, std::string(arg) + " requires a value",
                                  getSkeletonHelpMessage());
            }
            const char* value = argv[++i];
            if (is(arg, "-t", "--repo-type")) {
                if (std::strcmp(value, "model") != 0 && std::strcmp(value, "dataset") != 0) {
                    return usageError(result, kUsageErrorExit,
                                      std::string("invalid repo type: ") + value + " (choose model or dataset)",
                                      getSkeletonHelpMessage());
                }
                opts.repo_type = value;
            } else if (is(arg, "-r", "--revision")) {
                opts.revision = value;
            } else if (is(arg, "-e", "--endpoint")) {
                opts.endpoint = value;
            } else if (is(arg, nullptr, "--token")) {
                opts.token = value;
            } else if (is(arg, nullptr, "--include")) {
                opts.includes.emplace_back(value);
            } else if (is(arg, nullptr, "--exclude")) {
                opts.excludes.emplace_back(value);
            } else if (is(arg, nullptr, "--max-files")) {
                auto v = parseInteger(value);
                if (!v) {
                    return usageError(result, kUsageErrorExit, std::string("invalid --max-files: ") + value,
                                      getSkeletonHelpMessage());
                }
                opts.max_files = *v;
            } else if (is(arg, nullptr, "--dst")) {
                opts.dst = value;
            } else if (is(arg, nullptr, "--fill-size")) {
                opts.fill_size = value;
            } else {
                opts.fill_content = value;
            }
            continue;
        }

        if (arg[0] == '-') {
            return usageError(result, kUsageErrorExit, std::string("unknown option: ") + arg,
                              getSkeletonHelpMessage());
        }
        if (!opts.repo_id.empty()) {
            return usageError(result, kUsageErrorExit, std::string("unexpected argument: ") + arg,
                              getSkeletonHelpMessage());
        }
        opts.repo_id = arg;
    }

    if (opts.repo_id.empty()) {
        return usageError(result, kUsageErrorExit, "repository id required", getSkeletonHelpMessage());
    }
    if (opts.repo_type.empty()) {
        return usageError(result, kUsageErrorExit, "--repo-type is required", getSkeletonHelpMessage());
    }
    return result;
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "fakehub " << FAKEHUB_VERSION << " - local model hub mock server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    fakehub [COMMAND]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    serve      Start the server (default)\n";
    oss << "    skeleton   Create a local fixture tree from a remote repository listing\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'fakehub <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getServeHelpMessage() {
    std::ostringstream oss;
    oss << "fakehub serve - Start the server\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    fakehub serve [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --port <PORT>         Server port (default: 8000, or FAKEHUB_PORT)\n";
    oss << "    --host <HOST>         Bind address (default: 0.0.0.0)\n";
    oss << "    --root <DIR>          Fixture tree root (default: fake_hub)\n";
    oss << "    --threads <N>         Worker threads (default: 8)\n";
    oss << "    -h, --help            Print help\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    FAKEHUB_ROOT                Fixture tree root (legacy: FAKE_HUB_ROOT)\n";
    oss << "    FAKEHUB_PORT                HTTP server port\n";
    oss << "    FAKEHUB_BIND_ADDRESS        Bind address\n";
    oss << "    FAKEHUB_WORKER_THREADS      Worker threads\n";
    oss << "    FAKEHUB_PROBE_ETAG          Digest-based ETag on HEAD (default: 1)\n";
    oss << "    FAKEHUB_PATHS_INFO_DIGESTS  Digests in paths-info (default: 1)\n";
    oss << "    FAKEHUB_HASH_CACHE          memory|none (default: memory)\n";
    oss << "    FAKEHUB_CONFIG              Config file path (default: ~/.fakehub/config.json)\n";
    oss << "    FAKEHUB_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    FAKEHUB_LOG_DIR             Log directory (enables file logging)\n";
    oss << "    FAKEHUB_LOG_RETENTION_DAYS  Log retention days (default: 7)\n";
    oss << "    LOG_REQUESTS, LOG_HEADERS, LOG_BODY_MAX, LOG_BODY_ALL,\n";
    oss << "    LOG_RESP_HEADERS, LOG_REDACT  Request logging controls\n";
    return oss.str();
}

std::string getSkeletonHelpMessage() {
    std::ostringstream oss;
    oss << "fakehub skeleton - Create a fixture tree (structure and file names only)\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    fakehub skeleton <REPO_ID> -t <model|dataset> [OPTIONS]\n";
    oss << "\n";
    oss << "ARGUMENTS:\n";
    oss << "    <REPO_ID>                Repository id, e.g. 'gpt2' or 'org/name'\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -t, --repo-type <TYPE>   model or dataset (required)\n";
    oss << "    -r, --revision <REV>     Revision (default: main)\n";
    oss << "    -e, --endpoint <URL>     Remote endpoint (default: HF_REMOTE_ENDPOINT or https://huggingface.co)\n";
    oss << "    --token <TOKEN>          Access token (default: HF_TOKEN)\n";
    oss << "    --include <GLOB>         Keep matching paths (repeatable)\n";
    oss << "    --exclude <GLOB>         Drop matching paths (repeatable)\n";
    oss << "    --max-files <N>          Limit the number of files\n";
    oss << "    --dst <DIR>              Destination root (default: hub layout)\n";
    oss << "    --force                  Overwrite existing files\n";
    oss << "    --dry-run                Print actions without writing files\n";
    oss << "    --fill                   Fill files with repeated content instead of leaving them empty\n";
    oss << "    --fill-size <SIZE>       Per-file size, e.g. 16MiB (default with --fill: 16MiB)\n";
    oss << "    --fill-content <TEXT>    Content to repeat (default: zero bytes)\n";
    oss << "    -h, --help               Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "fakehub " << FAKEHUB_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    // No arguments - run the server with configured defaults
    if (argc < 2) {
        result.should_exit = false;
        result.subcommand = Subcommand::None;
        return result;
    }

    const char* command = argv[1];

    // Global help and version
    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "serve") == 0) {
        return parseServe(result, argc, argv, 2);
    }

    if (std::strcmp(command, "skeleton") == 0) {
        return parseSkeleton(result, argc, argv, 2);
    }

    // Serve flags without the subcommand name
    if (command[0] == '-' && std::strncmp(command, "--", 2) == 0) {
        CliResult serve = parseServe(result, argc, argv, 1);
        if (!serve.should_exit) serve.subcommand = Subcommand::None;
        return serve;
    }

    // Check for unknown flags (starting with -)
    if (command[0] == '-') {
        result.should_exit = true;
        result.exit_code = 1;
        std::ostringstream oss;
        oss << "Unknown option: " << command << "\n\n";
        oss << getHelpMessage();
        result.output = oss.str();
        return result;
    }

    // Unknown command
    result.should_exit = true;
    result.exit_code = 1;
    std::ostringstream oss;
    oss << "Unknown command: " << command << "\n\n";
    oss << getHelpMessage();
    result.output = oss.str();
    return result;
}

std::string subcommandToString(Subcommand subcommand) {
    switch (subcommand) {
        case Subcommand::None: return "none";
        case Subcommand::Serve: return "serve";
        case Subcommand::Skeleton: return "skeleton";
        default: return "unknown";
    }
}

}  // namespace fakehub
