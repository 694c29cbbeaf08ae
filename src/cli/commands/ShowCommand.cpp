#include "cli/commands/ShowCommand.hpp"

#include <iostream>

#include "cli/DetailsOptions.hpp"

namespace runcfg {

Expected<void> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        return Error{ErrorCode::InvalidArgs, "show: usage: runcfg show <context> [<key>]"};
    }
    CommandContext context(args[0]);
    const Commands& commands = ctx.config.commands();

    auto details = args.size() == 2 ? commands.getConfig(context, args[1])
                                    : commands.getOrDefaultConfig(context);
    if (!details) return details.error();

    printDetails(std::cout, details.value(), "  ");
    return {};
}

}
