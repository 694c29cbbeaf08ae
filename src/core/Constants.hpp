#pragma once

/**
 * @brief Names and defaults used throughout the codebase
 *
 * Centralizes document field names and well-known identifiers so the loader,
 * the emitter and the CLI agree on spelling.
 */
namespace runcfg {

namespace Constants {
    // Config file location
    constexpr const char* DEFAULT_CONFIG_FILE = ".runcfg.yaml";   // Relative to the current directory
    constexpr const char* CONFIG_PATH_ENV = "RUNCFG_CONFIG";      // Overrides the default location

    // Entry key used by the seeded contexts
    constexpr const char* DEFAULT_CONFIG_KEY = "default";

    // Well-known contexts
    constexpr const char* CONTEXT_RUN = "run";
    constexpr const char* CONTEXT_TEST = "test";
    constexpr const char* CONTEXT_BUILD = "build";
    constexpr const char* CONTEXT_BENCH = "bench";
    constexpr const char* CONTEXT_SCRIPT = "script";

    // Document fields
    namespace Field {
        constexpr const char* SETTINGS = "settings";
        constexpr const char* CONTEXT_POLICY = "context_policy";
        constexpr const char* COMMANDS = "commands";
        constexpr const char* ENTRIES = "entries";
        constexpr const char* DEFAULT_KEY = "default_key";
        constexpr const char* COMMAND = "command";
        constexpr const char* COMMAND_TYPE = "command_type";
        constexpr const char* ENV = "env";
        constexpr const char* PRE_COMMAND = "pre_command";
        constexpr const char* PARAMS = "params";
        constexpr const char* WORKING_DIRECTORY = "working_directory";
        constexpr const char* ALLOW_MULTIPLE_INSTANCES = "allow_multiple_instances";
    }
}
}
