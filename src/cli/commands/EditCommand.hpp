#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class EditCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "edit"; }
    const char* description() const override { return "Change fields of an existing config"; }
    const char* helpSynopsis() const override {
        return "runcfg edit <context> <key> [--command <line>] [--type cargo|shell] [--param <arg>]... "
               "[--clear-params] [--env NAME=VALUE]... [--unset-env NAME]... [--cwd <dir>] [--clear-cwd] "
               "[--pre <key>] [--clear-pre] [--allow-multiple|--single-instance]";
    }
    const char* helpDescription() const override {
        return "Start from the stored config, apply the given changes, validate and store the result. "
               "Fields that are not mentioned keep their values. Nothing is stored if validation fails.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {
            {"--command <line>", "Replace the command line"},
            {"--param <arg>", "Replace parameters (repeatable)"},
            {"--clear-params", "Drop all parameters"},
            {"--unset-env NAME", "Remove an environment variable"},
            {"--clear-cwd", "Run in the caller's directory"},
            {"--pre <key>", "Run another config of the same context first"},
            {"--clear-pre", "Remove the pre-command"},
            {"--single-instance", "Forbid concurrent instances"}
        };
    }
};

}

