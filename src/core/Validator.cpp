#include "core/Validator.hpp"

#include <utility>

#include "core/CommandDetails.hpp"

namespace runcfg {

FunctionValidator::FunctionValidator(Fn fn) : check(std::move(fn)) {}

Expected<void> FunctionValidator::validate(const CommandDetails& candidate) const {
    if (!check) return {};
    return check(candidate);
}

PredicateValidator::PredicateValidator(Fn fn, std::string failureMessage)
    : predicate(std::move(fn)), message(std::move(failureMessage)) {}

Expected<void> PredicateValidator::validate(const CommandDetails& candidate) const {
    if (!predicate || predicate(candidate)) return {};
    return Error{ErrorCode::ValidationFailed, message};
}

}
