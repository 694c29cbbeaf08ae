#pragma once

#include <string>

#include "core/Commands.hpp"
#include "core/ConfigDocument.hpp"
#include "core/ConfigStore.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/// Global settings consulted when defaulting
struct Settings {
    ContextPolicy contextPolicy{ContextPolicy::Strict};

    bool operator==(const Settings& other) const { return contextPolicy == other.contextPolicy; }
};

/**
 * @brief Persisted root object: the Commands registry plus Settings
 *
 * Owned by the process entry point and passed by reference to whoever needs
 * it; there is no global instance.
 *
 * Loading is two-pass:
 *   1. ConfigDocument::parse()  text -> sparse RawConfig (fails only on bad syntax)
 *   2. Config::materialize()    RawConfig -> Config, filling defaults (pure)
 *
 * Saving emits a deterministic document: contexts and entries in insertion
 * order, env names sorted, fields in a fixed order.
 */
class Config {
public:
    Config() = default;

    /// Registry seeded with the run/test/build/bench contexts
    static Config withDefaults();

    /// Parse and materialize a document (ParseFailure on unparseable text)
    static Expected<Config> parse(const std::string& text);

    /**
     * @brief Build a Config from a sparse document, defaulting absent fields
     *
     * Entries whose command is missing or blank are skipped, unknown command
     * types become Shell, and a default key naming no surviving entry is
     * dropped. Warnings are logged for each repair. No I/O.
     */
    static Config materialize(const RawConfig& raw);

    /// Sparse image of this Config with every field present
    RawConfig toRaw() const;

    /// Deterministic document text
    std::string serialize() const;

    /**
     * @brief Load from a store
     * @return withDefaults() when the store has no data yet; ReadFailure or
     *         ParseFailure on errors
     */
    static Expected<Config> load(const IConfigStore& store);

    /// Write serialize() to the store; WriteFailure on errors, state unchanged either way
    Expected<void> save(IConfigStore& store) const;

    Commands& commands() { return registry; }
    const Commands& commands() const { return registry; }
    Settings& settings() { return globalSettings; }
    const Settings& settings() const { return globalSettings; }

    bool operator==(const Config& other) const {
        return registry == other.registry && globalSettings == other.globalSettings;
    }
    bool operator!=(const Config& other) const { return !(*this == other); }

private:
    Commands registry;
    Settings globalSettings;
};

}

