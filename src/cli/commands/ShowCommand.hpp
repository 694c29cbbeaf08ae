#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class ShowCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Resolve and print a config"; }
    const char* helpSynopsis() const override { return "runcfg show <context> [<key>]"; }
    const char* helpDescription() const override {
        return "Resolve <context> to its default config and print it. When the context has a single config and "
               "no default, that config is used. With <key>, print that config instead.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {{"<key>", "Config key to print instead of the default"}};
    }
};

}

