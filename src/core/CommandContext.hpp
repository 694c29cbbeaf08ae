#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace runcfg {

/**
 * @brief Lookup key naming a usage scenario (e.g., "run", "test", "rust-test")
 *
 * Opaque to the registry: only equality and hashing are used. Immutable once
 * created.
 */
class CommandContext {
public:
    explicit CommandContext(std::string name) : contextName(std::move(name)) {}

    const std::string& name() const { return contextName; }

    bool operator==(const CommandContext& other) const { return contextName == other.contextName; }
    bool operator!=(const CommandContext& other) const { return contextName != other.contextName; }

private:
    std::string contextName;
};

inline std::ostream& operator<<(std::ostream& os, const CommandContext& ctx) {
    return os << ctx.name();
}

}

namespace std {

template <>
struct hash<runcfg::CommandContext> {
    size_t operator()(const runcfg::CommandContext& ctx) const noexcept {
        return hash<string>()(ctx.name());
    }
};

}

