#pragma once

#include "cli/ICommand.hpp"

namespace runcfg {

class RemoveCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "remove"; }
    const char* description() const override { return "Delete a config from a context"; }
    const char* helpSynopsis() const override { return "runcfg remove <context> <key>"; }
    const char* helpDescription() const override {
        return "Delete one config. If it was the context default, the context is left without a default.";
    }
};

}

