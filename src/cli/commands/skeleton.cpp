// fakehub skeleton command
// Mirrors a remote repository's file tree locally without downloading content

#include "cli/commands.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "hub/hash_cache.h"
#include "hub/hub_error.h"
#include "hub/hub_storage.h"
#include "hub/paths_info_sidecar.h"
#include "skeleton/skeleton_generator.h"
#include "skeleton/tree_fetcher.h"

namespace fs = std::filesystem;

namespace fakehub {
namespace cli {
namespace commands {

namespace {

std::optional<std::string> tokenFromEnv() {
    const char* token = std::getenv("HF_TOKEN");
    if (!token || !*token) return std::nullopt;
    return std::string(token);
}

std::string relativeTo(const fs::path& root, const fs::path& path) {
    return path.lexically_relative(root).generic_string();
}

}  // namespace

int skeleton(const SkeletonOptions& options, const HubConfig& config, std::ostream& out, std::ostream& err) {
    const std::optional<RepoKind> kind = parseRepoKind(options.repo_type);
    if (!kind) {
        err << "Error: invalid repo type '" << options.repo_type << "' (expected model or dataset)" << std::endl;
        return 2;
    }

    const std::string endpoint = options.endpoint ? *options.endpoint : defaultRemoteEndpoint();
    const std::optional<std::string> token = options.token ? options.token : tokenFromEnv();

    std::vector<TreeItem> items;
    try {
        TreeFetcher fetcher(endpoint, token);
        items = fetcher.fetch(*kind, options.repo_id, options.revision);
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return 2;
    }

    items = applyFilters(items, options.includes, options.excludes, options.max_files);
    spdlog::debug("skeleton: {} files after filtering", items.size());

    GenerateOptions gen;
    gen.force = options.force;
    gen.dry_run = options.dry_run;
    if (options.fill) {
        gen.fill_size = kDefaultFillSize;
        if (options.fill_size) {
            try {
                gen.fill_size = parseSize(*options.fill_size);
            } catch (const std::invalid_argument& e) {
                err << "Error parsing --fill-size: " << e.what() << std::endl;
                return 2;
            }
        }
        gen.fill_pattern = options.fill_content.value_or(std::string(1, '\0'));
    }

    fs::path destination;
    SkeletonResult result;
    try {
        destination = options.dst ? fs::path(*options.dst) : HubStorage(config.hub_root).repoDir(*kind, options.repo_id);
        result = generateSkeleton(destination, items, gen);
    } catch (const std::invalid_argument& e) {
        err << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const HubError& e) {
        err << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!options.dry_run) {
        // Precomputed digests let paths-info answer without rehashing the generated files.
        try {
            auto cache = makeHashCache("none");
            if (auto sidecar = writePathsInfoSidecar(result.root, result.created, *cache)) {
                out << "Wrote sidecar: " << sidecar->string() << "\n";
            }
        } catch (const IoError& e) {
            err << "Warning: failed to write " << kPathsInfoSidecarName << ": " << e.what() << std::endl;
        }
    }

    out << "Skeleton root: " << result.root.string() << "\n";
    out << "Files: " << result.created.size() << "\n";
    for (const auto& path : result.created) {
        out << relativeTo(result.root, path) << "\n";
    }
    out.flush();
    return 0;
}

}  // namespace commands
}  // namespace cli
}  // namespace fakehub
