#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

/// Prints the command overview, or the manual of one command
class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show this overview or the manual of one command"; }
    bool requiresLoadedConfig() const override { return false; }
    const char* helpSynopsis() const override { return "runcfg help [<command>]"; }
    const char* helpDescription() const override {
        return "Without arguments, list every command with a one-line summary and the config file in use. "
               "With a command name, print its synopsis, description and options.";
    }
};

}
