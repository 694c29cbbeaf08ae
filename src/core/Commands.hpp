#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/CommandConfig.hpp"
#include "core/CommandContext.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/// How setDefaultConfig treats a context that is not registered yet
enum class ContextPolicy {
    Strict,   // fail with ContextNotFound
    Lenient   // create the context, then select the key
};

const char* toString(ContextPolicy policy);

/**
 * @brief Registry mapping each CommandContext to its CommandConfig
 *
 * Contexts keep registration order so that persistence is deterministic.
 * A context is registered only through an update path (updateConfig,
 * getOrInsertConfigs, or a lenient setDefaultConfig) and is never
 * unregistered: Unregistered -> HasEntries -> HasDefault.
 *
 * Two lookup shapes are offered:
 *   getConfigs      lenient, returns an empty CommandConfig for unknown contexts
 *   requireConfigs  strict, fails with ContextNotFound
 */
class Commands {
public:
    using Entry = std::pair<CommandContext, CommandConfig>;

    /// Configs of context, or an empty CommandConfig; never registers
    CommandConfig getConfigs(const CommandContext& context) const;

    /// Configs of context, or ContextNotFound
    Expected<CommandConfig> requireConfigs(const CommandContext& context) const;

    /// Mutable configs of context, registering an empty CommandConfig if needed
    CommandConfig& getOrInsertConfigs(const CommandContext& context);

    /// Insert or replace one entry, registering context if needed
    void updateConfig(const CommandContext& context, const std::string& key, const CommandDetails& details);

    /**
     * @brief Resolve the default entry of context
     * @return NoConfigForContext when the context has no entries (or is unregistered),
     *         otherwise the result of CommandConfig::getDefault()
     */
    Expected<CommandDetails> getOrDefaultConfig(const CommandContext& context) const;

    /// One named entry: ContextNotFound or NotFound
    Expected<CommandDetails> getConfig(const CommandContext& context, const std::string& key) const;

    /**
     * @brief Select the default entry of context
     * @param policy Strict: unregistered context fails with ContextNotFound.
     *               Lenient: the context is created first; if selecting the key
     *               then fails (ConfigKeyNotFound), the creation is undone.
     */
    Expected<void> setDefaultConfig(const CommandContext& context, const std::string& key,
                                    ContextPolicy policy = ContextPolicy::Strict);

    /// Remove one entry: ContextNotFound or ConfigKeyNotFound
    Expected<void> removeConfig(const CommandContext& context, const std::string& key);

    bool contains(const CommandContext& context) const;
    size_t size() const { return registry.size(); }
    bool empty() const { return registry.empty(); }

    /// Read-only access in registration order
    const std::vector<Entry>& contexts() const { return registry; }

    bool operator==(const Commands& other) const { return registry == other.registry; }
    bool operator!=(const Commands& other) const { return !(*this == other); }

private:
    CommandConfig* findConfigs(const CommandContext& context);
    const CommandConfig* findConfigs(const CommandContext& context) const;

    std::vector<Entry> registry;
};

}

