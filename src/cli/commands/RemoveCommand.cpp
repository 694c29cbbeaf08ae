#include "cli/commands/RemoveCommand.hpp"

#include <iostream>

namespace runcfg {

Expected<void> RemoveCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "remove: usage: runcfg remove <context> <key>"};
    }
    CommandContext context(args[0]);
    auto res = ctx.config.commands().removeConfig(context, args[1]);
    if (!res) return res;

    auto saved = ctx.config.save(ctx.store);
    if (!saved) return saved;

    std::cout << "Removed " << context.name() << "/" << args[1] << "\n";
    return {};
}

}
