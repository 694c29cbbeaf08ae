#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class AddCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "add"; }
    const char* description() const override { return "Add or replace a config of a context"; }
    const char* helpSynopsis() const override {
        return "runcfg add <context> <key> <command> [--type cargo|shell] [--param <arg>]... [--params \"<args>\"] "
               "[--env NAME=VALUE]... [--cwd <dir>] [--pre <key>] [--allow-multiple] [--default]";
    }
    const char* helpDescription() const override {
        return "Build a config from the given command and options and store it under <key> in <context>, "
               "registering the context if needed. An existing config with the same key is replaced; "
               "the default selection is only changed with --default.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {
            {"--type <t>", "cargo or shell (default: shell)"},
            {"--param <arg>", "Append one parameter (repeatable)"},
            {"--params \"<args>\"", "Parameters as one whitespace-separated string"},
            {"--env NAME=VALUE", "Set an environment variable (repeatable)"},
            {"--cwd <dir>", "Working directory"},
            {"--pre <key>", "Run another config of the same context first"},
            {"--allow-multiple", "Permit concurrent instances"},
            {"--default", "Also make this config the context default"}
        };
    }
};

}

