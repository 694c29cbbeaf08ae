#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class ListCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "list"; }
    const char* description() const override { return "List contexts and their configs"; }
    const char* helpSynopsis() const override { return "runcfg list [<context>]"; }
    const char* helpDescription() const override {
        return "Print every context (or only <context>) with its config keys. The default config is marked with '*'.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {{"<context>", "Restrict the listing to one context"}};
    }
};

}

