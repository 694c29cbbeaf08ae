#include "cli/commands/AddCommand.hpp"

#include <iostream>
#include <memory>

#include "cli/DetailsOptions.hpp"
#include "core/CommandDetailsBuilder.hpp"
#include "core/PreCommandValidator.hpp"

namespace runcfg {

/**
 * @brief Execute 'runcfg add'
 *
 *   1. Parse <context> <key> <command> and field flags
 *   2. Build a CommandDetails (a --pre reference is checked against the
 *      context's existing keys)
 *   3. Insert or replace the entry, optionally select it as default
 *   4. Save the config
 */
Expected<void> AddCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseDetailsOptions(args, "add", true);
    if (!parsed) return parsed.error();
    const DetailsOptions& opts = parsed.value();
    const bool makeDefault = opts.makeDefault;

    if (opts.positional.size() != 3) {
        return Error{ErrorCode::InvalidArgs, "add: usage: runcfg add <context> <key> <command> [options]"};
    }
    CommandContext context(opts.positional[0]);
    const std::string& key = opts.positional[1];

    Commands& commands = ctx.config.commands();
    const CommandConfig existing = commands.getConfigs(context);

    CommandDetailsBuilder builder(opts.positional[2], CommandType::Shell);
    applyDetailsOptions(opts, {}, builder);
    if (opts.pre) {
        builder.addValidator(std::make_unique<PreCommandValidator>(existing, key));
    }
    auto details = builder.build();
    if (!details) return details.error();

    bool replaced = existing.contains(key);
    commands.updateConfig(context, key, details.value());
    if (makeDefault) {
        auto res = commands.setDefaultConfig(context, key);
        if (!res) return res;
    }

    auto saved = ctx.config.save(ctx.store);
    if (!saved) return saved;

    std::cout << (replaced ? "Updated " : "Added ") << context.name() << "/" << key
              << (makeDefault ? " (default)" : "") << "\n";
    return {};
}

}
