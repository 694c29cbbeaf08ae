#include "cli/commands/SetDefaultCommand.hpp"

#include <iostream>

namespace runcfg {

Expected<void> SetDefaultCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    ContextPolicy policy = ctx.config.settings().contextPolicy;
    std::vector<std::string> positional;
    for (const auto& a : args) {
        if (a == "--create") {
            policy = ContextPolicy::Lenient;
        } else if (a.rfind("--", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "set-default: unknown option " + a};
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "set-default: usage: runcfg set-default <context> <key> [--create]"};
    }

    CommandContext context(positional[0]);
    auto res = ctx.config.commands().setDefaultConfig(context, positional[1], policy);
    if (!res) return res;

    auto saved = ctx.config.save(ctx.store);
    if (!saved) return saved;

    std::cout << "Default for " << context.name() << " is now " << positional[1] << "\n";
    return {};
}

}
