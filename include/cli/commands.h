// CLI command function declarations
#pragma once

#include <iostream>

#include "utils/cli.h"
#include "utils/config.h"

namespace fakehub {
namespace cli {
namespace commands {

// Note: 'serve' is implemented directly in main.cpp as it owns the
// server infrastructure and the shutdown loop.

/// Execute the 'skeleton' command
/// @param options Skeleton options (repo id, type, filters, fill)
/// @param config Loaded configuration (hub root for the default destination)
/// @return Exit code (0=success, 2=usage or remote error, 1=local I/O error)
int skeleton(const SkeletonOptions& options, const HubConfig& config, std::ostream& out = std::cout,
             std::ostream& err = std::cerr);

}  // namespace commands
}  // namespace cli
}  // namespace fakehub
