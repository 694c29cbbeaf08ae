#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class InitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "init"; }
    const char* description() const override { return "Write a config file with the built-in contexts"; }
    bool requiresLoadedConfig() const override { return false; }
    const char* helpSynopsis() const override { return "runcfg init [--force]"; }
    const char* helpDescription() const override {
        return "Write a config file holding the run, test, build and bench contexts, each with a single "
               "'default' cargo entry. An existing file is kept unless --force is given.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {{"--force", "Overwrite an existing config file"}};
    }
};

}

