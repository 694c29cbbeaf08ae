#include "cli/commands/InitCommand.hpp"

#include <iostream>
#include <utility>

namespace runcfg {

Expected<void> InitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    bool force = false;
    for (const auto& a : args) {
        if (a == "--force") {
            force = true;
        } else {
            return Error{ErrorCode::InvalidArgs, "init: unexpected argument " + a};
        }
    }

    if (ctx.store.exists() && !force) {
        return Error{ErrorCode::AlreadyInitialized,
                     "config already exists at " + ctx.store.location() + " (use --force to overwrite)"};
    }

    Config seeded = Config::withDefaults();
    auto res = seeded.save(ctx.store);
    if (!res) return res;

    ctx.config = std::move(seeded);
    std::cout << "Initialized runcfg config in " << ctx.store.location() << "\n";
    return {};
}

}
