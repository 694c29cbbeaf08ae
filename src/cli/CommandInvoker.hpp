#pragma once

#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace runcfg {

/**
 * @brief Runs subcommands and reports their failures
 *
 * Failures are logged once, as "<name>: [<code>] <message>", and returned
 * to the caller unchanged so it can pick an exit status.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);

    /// Look name up in CommandFactory and invoke it; InvalidCommand if unknown
    Expected<void> invoke(const std::string& name, const AppContext& ctx, const std::vector<std::string>& args);
};

}
