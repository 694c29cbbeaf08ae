#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Flags given before the subcommand name
 *
 *   -v, --verbose           debug logging
 *   --config <path>         config file instead of the resolved default
 */
struct GlobalOptions {
    bool verbose{false};
    std::string configPath;
    size_t consumed{0};     // args taken by the flags; the subcommand starts here
};

/// Stops at the first argument not starting with '-'
Expected<GlobalOptions> parseGlobalOptions(const std::vector<std::string>& args);

}
