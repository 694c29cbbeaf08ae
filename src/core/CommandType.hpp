#pragma once

#include <optional>
#include <string>

namespace runcfg {

/// How the executor interprets CommandDetails::command
enum class CommandType {
    Cargo,  // command is a cargo subcommand line
    Shell   // command is handed to the shell as-is
};

/// Lowercase persisted name ("cargo", "shell")
const char* toString(CommandType type);

/// Parse a persisted name (case-insensitive); nullopt for unknown names
std::optional<CommandType> parseCommandType(const std::string& text);

}

