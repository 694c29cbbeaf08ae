#include "core/PreCommandValidator.hpp"

#include <utility>

#include "core/CommandConfig.hpp"
#include "core/CommandDetails.hpp"

namespace runcfg {

PreCommandValidator::PreCommandValidator(const CommandConfig& config, std::string ownKey)
    : key(std::move(ownKey)) {
    for (const auto& entry : config.entries()) {
        knownKeys.insert(entry.first);
    }
}

Expected<void> PreCommandValidator::validate(const CommandDetails& candidate) const {
    const auto& pre = candidate.preCommand();
    if (!pre || pre->empty()) return {};
    if (*pre == key) {
        return Error{ErrorCode::ValidationFailed, "Cannot set pre_command to its own key: " + key};
    }
    if (knownKeys.count(*pre) == 0) {
        return Error{ErrorCode::ValidationFailed, "pre_command '" + *pre + "' does not exist as a command key"};
    }
    return {};
}

}
