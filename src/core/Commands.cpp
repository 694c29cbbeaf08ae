#include "core/Commands.hpp"

#include <algorithm>

#include "util/Logger.hpp"

namespace runcfg {

const char* toString(ContextPolicy policy) {
    return policy == ContextPolicy::Lenient ? "lenient" : "strict";
}

CommandConfig* Commands::findConfigs(const CommandContext& context) {
    auto it = std::find_if(registry.begin(), registry.end(),
                           [&](const Entry& e) { return e.first == context; });
    return it == registry.end() ? nullptr : &it->second;
}

const CommandConfig* Commands::findConfigs(const CommandContext& context) const {
    auto it = std::find_if(registry.begin(), registry.end(),
                           [&](const Entry& e) { return e.first == context; });
    return it == registry.end() ? nullptr : &it->second;
}

CommandConfig Commands::getConfigs(const CommandContext& context) const {
    const CommandConfig* configs = findConfigs(context);
    return configs ? *configs : CommandConfig{};
}

Expected<CommandConfig> Commands::requireConfigs(const CommandContext& context) const {
    const CommandConfig* configs = findConfigs(context);
    if (!configs) {
        return Error{ErrorCode::ContextNotFound, "context not found: " + context.name()};
    }
    return *configs;
}

CommandConfig& Commands::getOrInsertConfigs(const CommandContext& context) {
    if (CommandConfig* configs = findConfigs(context)) {
        return *configs;
    }
    Logger::instance().debug("registering context: " + context.name());
    registry.emplace_back(context, CommandConfig{});
    return registry.back().second;
}

void Commands::updateConfig(const CommandContext& context, const std::string& key, const CommandDetails& details) {
    getOrInsertConfigs(context).updateConfig(key, details);
}

Expected<CommandDetails> Commands::getOrDefaultConfig(const CommandContext& context) const {
    const CommandConfig* configs = findConfigs(context);
    if (!configs || configs->empty()) {
        return Error{ErrorCode::NoConfigForContext, "no config stored for context: " + context.name()};
    }
    return configs->getDefault();
}

Expected<CommandDetails> Commands::getConfig(const CommandContext& context, const std::string& key) const {
    const CommandConfig* configs = findConfigs(context);
    if (!configs) {
        return Error{ErrorCode::ContextNotFound, "context not found: " + context.name()};
    }
    return configs->get(key);
}

Expected<void> Commands::setDefaultConfig(const CommandContext& context, const std::string& key, ContextPolicy policy) {
    if (CommandConfig* configs = findConfigs(context)) {
        return configs->setDefault(key);
    }
    if (policy == ContextPolicy::Strict) {
        return Error{ErrorCode::ContextNotFound, "context not found: " + context.name()};
    }

    // Lenient: register, then roll back if the key cannot be selected
    auto res = getOrInsertConfigs(context).setDefault(key);
    if (!res) {
        registry.pop_back();
    }
    return res;
}

Expected<void> Commands::removeConfig(const CommandContext& context, const std::string& key) {
    CommandConfig* configs = findConfigs(context);
    if (!configs) {
        return Error{ErrorCode::ContextNotFound, "context not found: " + context.name()};
    }
    return configs->removeConfig(key);
}

bool Commands::contains(const CommandContext& context) const {
    return findConfigs(context) != nullptr;
}

}
