#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "core/CommandDetails.hpp"
#include "core/CommandDetailsBuilder.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Field flags shared by the add and edit commands
 *
 *   --command <line>        replace the command line
 *   --type cargo|shell      command type
 *   --param <arg>           append one parameter (repeatable; replaces stored params)
 *   --params "<a b c>"      parameters as one whitespace-separated string
 *   --clear-params          drop all parameters
 *   --env NAME=VALUE        set a variable (repeatable)
 *   --unset-env NAME        remove a variable (repeatable)
 *   --cwd <dir>             working directory
 *   --clear-cwd             use the caller's directory
 *   --pre <key>             pre-command (another entry of the same context)
 *   --clear-pre             no pre-command
 *   --allow-multiple        permit concurrent instances
 *   --single-instance       forbid concurrent instances
 *   --default               select the entry as default (add only)
 *
 * Anything not starting with "--" is collected as a positional argument.
 */
struct DetailsOptions {
    std::optional<std::string> command;
    std::optional<CommandType> type;
    std::optional<std::vector<std::string>> params;
    bool clearParams{false};
    std::vector<std::pair<std::string, std::string>> envSet;
    std::vector<std::string> envUnset;
    std::optional<std::string> cwd;
    bool clearCwd{false};
    std::optional<std::string> pre;
    bool clearPre{false};
    std::optional<bool> allowMultiple;
    bool makeDefault{false};
    std::vector<std::string> positional;
};

/// Parse args; InvalidArgs names the offending flag, prefixed with cmdName.
/// --default is only recognised when acceptDefault is set.
Expected<DetailsOptions> parseDetailsOptions(const std::vector<std::string>& args, const std::string& cmdName,
                                             bool acceptDefault = false);

/// Apply parsed flags to builder; baseEnv is the environment being edited
void applyDetailsOptions(const DetailsOptions& opts, const CommandDetails::EnvMap& baseEnv,
                         CommandDetailsBuilder& builder);

/// Multi-line, indented description of one entry
void printDetails(std::ostream& os, const CommandDetails& details, const std::string& indent);

}

