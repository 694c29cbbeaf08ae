#include "core/CommandConfig.hpp"

#include <algorithm>

namespace runcfg {

std::vector<CommandConfig::Entry>::iterator CommandConfig::find(const std::string& key) {
    return std::find_if(items.begin(), items.end(), [&](const Entry& e) { return e.first == key; });
}

std::vector<CommandConfig::Entry>::const_iterator CommandConfig::find(const std::string& key) const {
    return std::find_if(items.begin(), items.end(), [&](const Entry& e) { return e.first == key; });
}

void CommandConfig::updateConfig(const std::string& key, const CommandDetails& details) {
    auto it = find(key);
    if (it != items.end()) {
        it->second = details;
        return;
    }
    items.emplace_back(key, details);
}

Expected<void> CommandConfig::setDefault(const std::string& key) {
    if (find(key) == items.end()) {
        return Error{ErrorCode::ConfigKeyNotFound, "config key not found: " + key};
    }
    defaultEntryKey = key;
    return {};
}

Expected<CommandDetails> CommandConfig::get(const std::string& key) const {
    auto it = find(key);
    if (it == items.end()) {
        return Error{ErrorCode::NotFound, "no config named: " + key};
    }
    return it->second;
}

Expected<CommandDetails> CommandConfig::getDefault() const {
    if (defaultEntryKey) {
        return get(*defaultEntryKey);
    }
    if (items.size() == 1) {
        return items.front().second;
    }
    return Error{ErrorCode::NoDefaultConfigured,
                 "no default selected among " + std::to_string(items.size()) + " configs"};
}

Expected<void> CommandConfig::removeConfig(const std::string& key) {
    auto it = find(key);
    if (it == items.end()) {
        return Error{ErrorCode::ConfigKeyNotFound, "config key not found: " + key};
    }
    items.erase(it);
    if (defaultEntryKey && *defaultEntryKey == key) {
        defaultEntryKey.reset();
    }
    return {};
}

Expected<void> CommandConfig::editConfig(const std::string& key,
                                         const std::function<void(CommandDetailsBuilder&)>& edit) {
    auto it = find(key);
    if (it == items.end()) {
        return Error{ErrorCode::ConfigKeyNotFound, "config key not found: " + key};
    }
    auto builder = CommandDetailsBuilder::from(it->second);
    if (edit) edit(builder);
    auto rebuilt = builder.build();
    if (!rebuilt) return rebuilt.error();
    it->second = rebuilt.value();
    return {};
}

bool CommandConfig::contains(const std::string& key) const {
    return find(key) != items.end();
}

bool CommandConfig::operator==(const CommandConfig& other) const {
    return items == other.items && defaultEntryKey == other.defaultEntryKey;
}

}
