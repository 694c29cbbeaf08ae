#pragma once

#include <functional>
#include <memory>
#include <string>

#include "util/Expected.hpp"

namespace runcfg {

class CommandDetails;

/**
 * @brief Strategy interface for checks run against an assembled CommandDetails
 *
 * Validators are registered on a CommandDetailsBuilder and run by build() in
 * registration order. A failing validator returns an Error whose message is
 * surfaced to the caller as ValidationFailed.
 */
class Validator {
public:
    virtual ~Validator() = default;

    /// Accept (empty Expected) or reject (Error) the candidate
    virtual Expected<void> validate(const CommandDetails& candidate) const = 0;
};

/// Adapts a closure returning Expected<void>
class FunctionValidator : public Validator {
public:
    using Fn = std::function<Expected<void>(const CommandDetails&)>;

    explicit FunctionValidator(Fn fn);
    Expected<void> validate(const CommandDetails& candidate) const override;

private:
    Fn check;
};

/// Adapts a pass/fail closure; failures report a fixed message
class PredicateValidator : public Validator {
public:
    using Fn = std::function<bool(const CommandDetails&)>;

    PredicateValidator(Fn fn, std::string failureMessage);
    Expected<void> validate(const CommandDetails& candidate) const override;

private:
    Fn predicate;
    std::string message;
};

}

