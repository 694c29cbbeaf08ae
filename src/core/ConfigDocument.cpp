#include "core/ConfigDocument.hpp"

#include <yaml-cpp/yaml.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"
#include "util/Strings.hpp"

namespace runcfg {
namespace ConfigDocument {

namespace F = Constants::Field;

namespace {

// Legacy spelling of command_type written by older tool versions
constexpr const char* LEGACY_TYPE_FIELD = "type";

void warnShape(const std::string& where, const char* expected) {
    Logger::instance().warn("config: ignoring " + where + " (expected " + expected + ")");
}

std::optional<std::string> readString(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsScalar()) {
        warnShape(where, "a string");
        return std::nullopt;
    }
    return node.Scalar();
}

std::optional<bool> readBool(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return std::nullopt;
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        warnShape(where, "true or false");
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> readKey(const YAML::Node& key, const std::string& where) {
    // "" is a valid key; only mappings, sequences and nulls are refused
    if (!key.IsScalar()) {
        warnShape("non-scalar key in " + where, "a string key");
        return std::nullopt;
    }
    return key.Scalar();
}

std::optional<std::vector<std::string>> readParams(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return std::nullopt;
    if (node.IsScalar()) {
        // Hand-edited files often write params as one string
        return Strings::splitWhitespace(node.Scalar());
    }
    if (!node.IsSequence()) {
        warnShape(where, "a list of strings");
        return std::nullopt;
    }
    std::vector<std::string> params;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            warnShape("item of " + where, "a string");
            continue;
        }
        params.push_back(item.Scalar());
    }
    return params;
}

std::optional<std::map<std::string, std::string>> readEnv(const YAML::Node& node, const std::string& where) {
    if (!node || node.IsNull()) return std::nullopt;
    if (!node.IsMap()) {
        warnShape(where, "a mapping of NAME: value");
        return std::nullopt;
    }
    std::map<std::string, std::string> env;
    for (const auto& kv : node) {
        auto name = readKey(kv.first, where);
        if (!name) continue;
        if (kv.second.IsNull()) {
            env[*name] = "";
            continue;
        }
        if (!kv.second.IsScalar()) {
            warnShape(where + "." + *name, "a string");
            continue;
        }
        env[*name] = kv.second.Scalar();
    }
    return env;
}

RawCommandDetails readDetails(const YAML::Node& node, const std::string& where) {
    RawCommandDetails raw;
    if (!node.IsMap()) {
        if (!node.IsNull()) warnShape(where, "a mapping");
        return raw;
    }
    raw.command = readString(node[F::COMMAND], where + "." + F::COMMAND);
    raw.commandType = readString(node[F::COMMAND_TYPE], where + "." + F::COMMAND_TYPE);
    if (!raw.commandType) {
        raw.commandType = readString(node[LEGACY_TYPE_FIELD], where + "." + LEGACY_TYPE_FIELD);
    }
    raw.env = readEnv(node[F::ENV], where + "." + F::ENV);
    raw.preCommand = readString(node[F::PRE_COMMAND], where + "." + F::PRE_COMMAND);
    raw.params = readParams(node[F::PARAMS], where + "." + F::PARAMS);
    raw.workingDirectory = readString(node[F::WORKING_DIRECTORY], where + "." + F::WORKING_DIRECTORY);
    raw.allowMultipleInstances = readBool(node[F::ALLOW_MULTIPLE_INSTANCES], where + "." + F::ALLOW_MULTIPLE_INSTANCES);
    return raw;
}

RawCommandConfig readCommandConfig(const YAML::Node& node, const std::string& where) {
    RawCommandConfig raw;
    if (!node.IsMap()) {
        if (!node.IsNull()) warnShape(where, "a mapping");
        return raw;
    }
    raw.defaultKey = readString(node[F::DEFAULT_KEY], where + "." + F::DEFAULT_KEY);

    const YAML::Node entries = node[F::ENTRIES];
    if (!entries || entries.IsNull()) return raw;
    if (!entries.IsMap()) {
        warnShape(where + "." + F::ENTRIES, "a mapping");
        return raw;
    }
    for (const auto& kv : entries) {
        auto key = readKey(kv.first, where + "." + F::ENTRIES);
        if (!key) continue;
        raw.entries.emplace_back(*key, readDetails(kv.second, where + "." + *key));
    }
    return raw;
}

void emitDetails(YAML::Emitter& out, const RawCommandDetails& d) {
    out << YAML::BeginMap;
    if (d.command) out << YAML::Key << F::COMMAND << YAML::Value << *d.command;
    if (d.commandType) out << YAML::Key << F::COMMAND_TYPE << YAML::Value << *d.commandType;
    if (d.env) {
        out << YAML::Key << F::ENV << YAML::Value << YAML::BeginMap;
        for (const auto& kv : *d.env) {
            out << YAML::Key << kv.first << YAML::Value << kv.second;
        }
        out << YAML::EndMap;
    }
    if (d.preCommand) out << YAML::Key << F::PRE_COMMAND << YAML::Value << *d.preCommand;
    if (d.params) {
        out << YAML::Key << F::PARAMS << YAML::Value << YAML::BeginSeq;
        for (const auto& p : *d.params) out << p;
        out << YAML::EndSeq;
    }
    if (d.workingDirectory) out << YAML::Key << F::WORKING_DIRECTORY << YAML::Value << *d.workingDirectory;
    if (d.allowMultipleInstances) {
        out << YAML::Key << F::ALLOW_MULTIPLE_INSTANCES << YAML::Value << *d.allowMultipleInstances;
    }
    out << YAML::EndMap;
}

}

Expected<RawConfig> parse(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseFailure, std::string("invalid YAML: ") + e.what()};
    }

    RawConfig raw;
    if (!root || root.IsNull()) return raw;
    if (!root.IsMap()) {
        return Error{ErrorCode::ParseFailure, "document root must be a mapping"};
    }

    try {
        const YAML::Node settings = root[F::SETTINGS];
        if (settings && settings.IsMap()) {
            raw.settings.contextPolicy = readString(settings[F::CONTEXT_POLICY],
                                                    std::string(F::SETTINGS) + "." + F::CONTEXT_POLICY);
        } else if (settings && !settings.IsNull()) {
            warnShape(F::SETTINGS, "a mapping");
        }

        const YAML::Node commands = root[F::COMMANDS];
        if (commands && commands.IsMap()) {
            for (const auto& kv : commands) {
                auto context = readKey(kv.first, F::COMMANDS);
                if (!context) continue;
                raw.commands.emplace_back(*context, readCommandConfig(kv.second, *context));
            }
        } else if (commands && !commands.IsNull()) {
            warnShape(F::COMMANDS, "a mapping");
        }
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseFailure, std::string("malformed document: ") + e.what()};
    }
    return raw;
}

std::string emit(const RawConfig& raw) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << F::SETTINGS << YAML::Value << YAML::BeginMap;
    if (raw.settings.contextPolicy) {
        out << YAML::Key << F::CONTEXT_POLICY << YAML::Value << *raw.settings.contextPolicy;
    }
    out << YAML::EndMap;

    out << YAML::Key << F::COMMANDS << YAML::Value << YAML::BeginMap;
    for (const auto& [context, config] : raw.commands) {
        out << YAML::Key << context << YAML::Value << YAML::BeginMap;
        if (config.defaultKey) {
            out << YAML::Key << F::DEFAULT_KEY << YAML::Value << *config.defaultKey;
        }
        out << YAML::Key << F::ENTRIES << YAML::Value << YAML::BeginMap;
        for (const auto& [key, details] : config.entries) {
            out << YAML::Key << key << YAML::Value;
            emitDetails(out, details);
        }
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

}
}
