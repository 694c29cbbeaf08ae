#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Sparse image of one persisted CommandDetails
 *
 * Every field is optional: absent (or wrongly typed) fields stay empty here
 * and receive their defaults in Config::materialize().
 */
struct RawCommandDetails {
    std::optional<std::string> command;
    std::optional<std::string> commandType;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<std::string> preCommand;
    std::optional<std::vector<std::string>> params;
    std::optional<std::string> workingDirectory;
    std::optional<bool> allowMultipleInstances;
};

/// Sparse image of one context's CommandConfig
struct RawCommandConfig {
    std::vector<std::pair<std::string, RawCommandDetails>> entries;  // Document order
    std::optional<std::string> defaultKey;
};

struct RawSettings {
    std::optional<std::string> contextPolicy;
};

/// Sparse image of the whole document
struct RawConfig {
    RawSettings settings;
    std::vector<std::pair<std::string, RawCommandConfig>> commands;  // Document order
};

/**
 * @brief YAML reader/writer for the config document
 *
 * Document layout:
 *   settings:
 *     context_policy: strict
 *   commands:
 *     <context>:
 *       default_key: <config key>
 *       entries:
 *         <config key>:
 *           command: cargo test
 *           command_type: cargo
 *           env: {NAME: value}
 *           pre_command: <config key>
 *           params: [--release]
 *           working_directory: /path
 *           allow_multiple_instances: false
 *
 * parse() is lenient about shape: a field with the wrong node kind is
 * dropped with a warning. It fails (ParseFailure) only when the text is not
 * valid YAML or the document root is not a mapping. An empty document
 * parses to an empty RawConfig.
 */
namespace ConfigDocument {

Expected<RawConfig> parse(const std::string& text);

/// Emit in a fixed field order; absent optionals are omitted
std::string emit(const RawConfig& raw);

}

}

