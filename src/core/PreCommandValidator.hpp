#pragma once

#include <string>
#include <unordered_set>

#include "core/Validator.hpp"

namespace runcfg {

class CommandConfig;

/**
 * @brief Checks that a pre-command names another entry of the same context
 *
 * Rules for the entry stored under ownKey:
 *   - no pre-command (or an empty one) is always accepted
 *   - the pre-command must not name ownKey
 *   - the pre-command must name an existing entry of the context
 */
class PreCommandValidator : public Validator {
public:
    /// Snapshot the entry keys of config; ownKey is the entry being built
    PreCommandValidator(const CommandConfig& config, std::string ownKey);

    Expected<void> validate(const CommandDetails& candidate) const override;

private:
    std::unordered_set<std::string> knownKeys;
    std::string key;
};

}

