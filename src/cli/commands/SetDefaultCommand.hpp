#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class SetDefaultCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "set-default"; }
    const char* description() const override { return "Select the default config of a context"; }
    const char* helpSynopsis() const override { return "runcfg set-default <context> <key> [--create]"; }
    const char* helpDescription() const override {
        return "Make <key> the default config of <context>. The key must already exist in the context. "
               "An unknown context is an error unless --create is given or settings.context_policy is lenient.";
    }
    std::vector<HelpOption> helpOptions() const override {
        return {{"--create", "Use the lenient context policy for this call"}};
    }
};

}

