#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/CommandDetails.hpp"
#include "core/CommandDetailsBuilder.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Named CommandDetails entries of one context, plus the default choice
 *
 * Entries keep insertion order; replacing an entry keeps its position.
 * Invariant: when a default key is set, an entry with that key exists.
 *
 * Default resolution (getDefault):
 *   1. the entry named by the default key, if set
 *   2. otherwise the only entry, if there is exactly one
 *   3. otherwise NoDefaultConfigured
 */
class CommandConfig {
public:
    using Entry = std::pair<std::string, CommandDetails>;

    /// Insert or replace the entry at key; never changes the default key
    void updateConfig(const std::string& key, const CommandDetails& details);

    /// Select the default entry; ConfigKeyNotFound if key is not an entry
    Expected<void> setDefault(const std::string& key);

    /// Entry at key, or NotFound
    Expected<CommandDetails> get(const std::string& key) const;

    /// Resolve the default entry (see class comment)
    Expected<CommandDetails> getDefault() const;

    /**
     * @brief Remove the entry at key
     * @return ConfigKeyNotFound if absent
     *
     * Removing the default entry leaves no default selected.
     */
    Expected<void> removeConfig(const std::string& key);

    /**
     * @brief Rebuild the entry at key through a builder seeded with its fields
     * @param key Entry to edit
     * @param edit Mutates the builder (may also add validators)
     * @return ConfigKeyNotFound, or the builder's error; the entry is unchanged on failure
     */
    Expected<void> editConfig(const std::string& key, const std::function<void(CommandDetailsBuilder&)>& edit);

    bool contains(const std::string& key) const;
    size_t size() const { return items.size(); }
    bool empty() const { return items.empty(); }

    /// Read-only access to entries in insertion order
    const std::vector<Entry>& entries() const { return items; }

    const std::optional<std::string>& defaultKey() const { return defaultEntryKey; }

    bool operator==(const CommandConfig& other) const;
    bool operator!=(const CommandConfig& other) const { return !(*this == other); }

private:
    std::vector<Entry>::iterator find(const std::string& key);
    std::vector<Entry>::const_iterator find(const std::string& key) const;

    std::vector<Entry> items;                      // (config key, details) in insertion order
    std::optional<std::string> defaultEntryKey;    // None until setDefault succeeds
};

}

