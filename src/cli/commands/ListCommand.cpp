#include "cli/commands/ListCommand.hpp"

#include <iostream>

namespace runcfg {

namespace {

void printContext(const CommandContext& context, const CommandConfig& configs) {
    std::cout << context.name() << "\n";
    if (configs.empty()) {
        std::cout << "    (no configs)\n";
        return;
    }
    for (const auto& [key, details] : configs.entries()) {
        bool isDefault = configs.defaultKey() && *configs.defaultKey() == key;
        std::cout << "  " << (isDefault ? "* " : "  ") << key
                  << "\t[" << toString(details.commandType()) << "] " << details.command() << "\n";
    }
}

}

/**
 * @brief Execute 'runcfg list'
 *
 * Without arguments every registered context is printed in registration
 * order; with a context name only that context is printed (ContextNotFound
 * if it is not registered).
 */
Expected<void> ListCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    const Commands& commands = ctx.config.commands();

    if (!args.empty()) {
        CommandContext context(args.front());
        auto configs = commands.requireConfigs(context);
        if (!configs) return configs.error();
        printContext(context, configs.value());
        return {};
    }

    if (commands.empty()) {
        std::cout << "No contexts configured in " << ctx.store.location() << "\n";
        return {};
    }
    for (const auto& [context, configs] : commands.contexts()) {
        printContext(context, configs);
    }
    return {};
}

}
