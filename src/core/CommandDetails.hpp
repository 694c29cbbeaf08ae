#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/CommandType.hpp"

namespace runcfg {

class CommandDetailsBuilder;

/**
 * @brief One concrete way to run a command
 *
 * Immutable value: there are getters only, and the only way to obtain an
 * instance is CommandDetailsBuilder::build(), so every instance in the
 * system has a non-blank command and has passed its validators.
 * Editing an entry means building a replacement
 * (CommandDetailsBuilder::from) and substituting it in its CommandConfig.
 *
 * Defaults for optional fields:
 *   env                      -> empty
 *   pre_command              -> none
 *   params                   -> empty
 *   working_directory        -> none (caller's current directory)
 *   allow_multiple_instances -> false
 */
class CommandDetails {
public:
    using EnvMap = std::map<std::string, std::string>;  // Sorted for deterministic output

    const std::string& command() const { return commandLine; }
    CommandType commandType() const { return type; }
    const EnvMap& env() const { return environment; }
    const std::optional<std::string>& preCommand() const { return preCommandLine; }
    const std::vector<std::string>& params() const { return arguments; }
    const std::optional<std::filesystem::path>& workingDirectory() const { return cwd; }
    bool allowMultipleInstances() const { return multipleInstances; }

    /// Field-wise equality over every persisted field
    bool operator==(const CommandDetails& other) const;
    bool operator!=(const CommandDetails& other) const { return !(*this == other); }

private:
    friend class CommandDetailsBuilder;

    CommandDetails(std::string command, CommandType commandType);

    std::string commandLine;
    CommandType type;
    EnvMap environment;
    std::optional<std::string> preCommandLine;
    std::vector<std::string> arguments;
    std::optional<std::filesystem::path> cwd;
    bool multipleInstances{false};
};

}

