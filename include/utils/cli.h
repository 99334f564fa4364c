#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fakehub {

/// Subcommand types for the fakehub CLI
enum class Subcommand {
    None,      // No subcommand (runs the server)
    Serve,     // serve
    Skeleton,  // skeleton <repo_id>
};

/// Options for serve command. Unset fields keep the loaded configuration.
struct ServeOptions {
    std::optional<uint16_t> port;
    std::optional<std::string> host;
    std::optional<std::string> root;
    std::optional<int> threads;
};

/// Options for skeleton command
struct SkeletonOptions {
    std::string repo_id;
    std::string repo_type;  // "model" | "dataset"
    std::string revision{"main"};
    std::optional<std::string> endpoint;  // default: HF_REMOTE_ENDPOINT or https://huggingface.co
    std::optional<std::string> token;     // default: HF_TOKEN
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
    std::optional<long long> max_files;
    std::optional<std::string> dst;
    bool force{false};
    bool dry_run{false};
    bool fill{false};
    std::optional<std::string> fill_size;
    std::optional<std::string> fill_content;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    /// Parsed subcommand
    Subcommand subcommand{Subcommand::None};

    ServeOptions serve_options;
    SkeletonOptions skeleton_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getServeHelpMessage();
std::string getSkeletonHelpMessage();
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace fakehub
