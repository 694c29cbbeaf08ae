#include "cli/commands/EditCommand.hpp"

#include <iostream>
#include <memory>

#include "cli/DetailsOptions.hpp"
#include "core/PreCommandValidator.hpp"

namespace runcfg {

Expected<void> EditCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parseDetailsOptions(args, "edit");
    if (!parsed) return parsed.error();
    const DetailsOptions& opts = parsed.value();

    if (opts.positional.size() != 2) {
        return Error{ErrorCode::InvalidArgs, "edit: usage: runcfg edit <context> <key> [options]"};
    }
    CommandContext context(opts.positional[0]);
    const std::string& key = opts.positional[1];

    Commands& commands = ctx.config.commands();
    if (!commands.contains(context)) {
        return Error{ErrorCode::ContextNotFound, "context not found: " + context.name()};
    }
    CommandConfig& configs = commands.getOrInsertConfigs(context);

    auto current = configs.get(key);
    if (!current) return Error{ErrorCode::ConfigKeyNotFound, "config key not found: " + key};
    const CommandDetails::EnvMap baseEnv = current.value().env();

    auto res = configs.editConfig(key, [&](CommandDetailsBuilder& builder) {
        applyDetailsOptions(opts, baseEnv, builder);
        if (opts.pre) builder.addValidator(std::make_unique<PreCommandValidator>(configs, key));
    });
    if (!res) return res;

    auto saved = ctx.config.save(ctx.store);
    if (!saved) return saved;

    std::cout << "Updated " << context.name() << "/" << key << "\n";
    return {};
}

}
