#include "core/Config.hpp"

#include "core/CommandDetailsBuilder.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/Strings.hpp"

namespace runcfg {

namespace {

ContextPolicy policyFromText(const std::optional<std::string>& text) {
    if (!text) return ContextPolicy::Strict;
    std::string v = Strings::trim(*text);
    if (v == "lenient") return ContextPolicy::Lenient;
    if (v != "strict") {
        Logger::instance().warn("config: unknown context_policy '" + v + "', using strict");
    }
    return ContextPolicy::Strict;
}

/// Materialize one entry; nullopt when it cannot satisfy the CommandDetails invariant
std::optional<CommandDetails> materializeDetails(const std::string& where, const RawCommandDetails& raw) {
    auto& log = Logger::instance();
    if (!raw.command || Strings::isBlank(*raw.command)) {
        log.warn("config: skipping " + where + " (missing command)");
        return std::nullopt;
    }

    CommandType type = CommandType::Shell;
    if (raw.commandType) {
        if (auto parsed = parseCommandType(*raw.commandType)) {
            type = *parsed;
        } else {
            log.warn("config: " + where + " has unknown command_type '" + *raw.commandType + "', using shell");
        }
    }

    CommandDetailsBuilder builder(*raw.command, type);
    if (raw.env) builder.env(*raw.env);
    if (raw.params) builder.params(*raw.params);
    if (raw.preCommand) builder.preCommand(*raw.preCommand);
    if (raw.workingDirectory) builder.workingDirectory(*raw.workingDirectory);
    if (raw.allowMultipleInstances) builder.allowMultipleInstances(*raw.allowMultipleInstances);

    auto built = builder.build();
    if (!built) {
        log.warn("config: skipping " + where + " (" + built.error().message + ")");
        return std::nullopt;
    }
    return built.value();
}

RawCommandDetails toRawDetails(const CommandDetails& d) {
    RawCommandDetails raw;
    raw.command = d.command();
    raw.commandType = toString(d.commandType());
    raw.env = d.env();
    raw.preCommand = d.preCommand();
    raw.params = d.params();
    if (d.workingDirectory()) raw.workingDirectory = d.workingDirectory()->generic_string();
    raw.allowMultipleInstances = d.allowMultipleInstances();
    return raw;
}

}

Config Config::withDefaults() {
    struct Seed {
        const char* context;
        const char* command;
    };
    static const Seed seeds[] = {
        {Constants::CONTEXT_RUN, "run --package ${packageName} --bin ${binaryName}"},
        {Constants::CONTEXT_TEST, "test"},
        {Constants::CONTEXT_BUILD, "build"},
        {Constants::CONTEXT_BENCH, "bench"},
    };

    Config config;
    for (const auto& seed : seeds) {
        CommandContext context(seed.context);
        auto details = CommandDetailsBuilder(seed.command, CommandType::Cargo).build();
        if (!details) {
            Logger::instance().error("seeding " + context.name() + ": " + details.error().message);
            continue;
        }
        config.registry.updateConfig(context, Constants::DEFAULT_CONFIG_KEY, details.value());
        auto res = config.registry.setDefaultConfig(context, Constants::DEFAULT_CONFIG_KEY);
        if (!res) Logger::instance().error("seeding " + context.name() + ": " + res.error().message);
    }
    return config;
}

Config Config::materialize(const RawConfig& raw) {
    auto& log = Logger::instance();
    Config config;
    config.globalSettings.contextPolicy = policyFromText(raw.settings.contextPolicy);

    for (const auto& [contextName, rawConfig] : raw.commands) {
        CommandContext context(contextName);
        CommandConfig& configs = config.registry.getOrInsertConfigs(context);

        for (const auto& [key, rawDetails] : rawConfig.entries) {
            auto details = materializeDetails(contextName + "." + key, rawDetails);
            if (details) configs.updateConfig(key, *details);
        }

        if (rawConfig.defaultKey) {
            if (!configs.setDefault(*rawConfig.defaultKey)) {
                log.warn("config: " + contextName + " default_key '" + *rawConfig.defaultKey +
                         "' names no entry, leaving default unset");
            }
        }
    }
    return config;
}

Expected<Config> Config::parse(const std::string& text) {
    auto raw = ConfigDocument::parse(text);
    if (!raw) return raw.error();
    return materialize(raw.value());
}

RawConfig Config::toRaw() const {
    RawConfig raw;
    raw.settings.contextPolicy = toString(globalSettings.contextPolicy);
    for (const auto& [context, configs] : registry.contexts()) {
        RawCommandConfig rawConfig;
        rawConfig.defaultKey = configs.defaultKey();
        for (const auto& [key, details] : configs.entries()) {
            rawConfig.entries.emplace_back(key, toRawDetails(details));
        }
        raw.commands.emplace_back(context.name(), std::move(rawConfig));
    }
    return raw;
}

std::string Config::serialize() const {
    return ConfigDocument::emit(toRaw());
}

Expected<Config> Config::load(const IConfigStore& store) {
    auto& log = Logger::instance();
    if (!store.exists()) {
        log.debug("no config at " + store.location() + ", using built-in defaults");
        return withDefaults();
    }
    auto bytes = store.read();
    if (!bytes) return bytes.error();

    auto config = parse(bytes.value());
    if (!config) {
        return Error{config.error().code, store.location() + ": " + config.error().message};
    }
    log.debug("loaded " + std::to_string(config.value().commands().size()) + " contexts from " + store.location());
    return config;
}

Expected<void> Config::save(IConfigStore& store) const {
    auto res = store.write(serialize());
    if (!res) return res;
    Logger::instance().debug("saved config to " + store.location());
    return {};
}

}
