#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/CommandDetails.hpp"
#include "core/Validator.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Validating constructor for CommandDetails
 *
 * The command and its type are required up front; every other field is
 * optional and set through chainable setters (a repeated call overwrites the
 * previous value). Validators accumulate and run in registration order.
 *
 * Usage:
 *   CommandDetailsBuilder builder("cargo test", CommandType::Cargo);
 *   builder.params({"--", "--nocapture"}).allowMultipleInstances(true);
 *   auto details = builder.build();
 *
 * build() spends the builder: validators are released and a second call
 * fails.
 */
class CommandDetailsBuilder {
public:
    CommandDetailsBuilder(std::string command, CommandType commandType);

    /// Seed a builder with every field of an existing value (edit path)
    static CommandDetailsBuilder from(const CommandDetails& details);

    CommandDetailsBuilder(CommandDetailsBuilder&&) = default;
    CommandDetailsBuilder& operator=(CommandDetailsBuilder&&) = default;
    CommandDetailsBuilder(const CommandDetailsBuilder&) = delete;
    CommandDetailsBuilder& operator=(const CommandDetailsBuilder&) = delete;

    CommandDetailsBuilder& command(std::string command);
    CommandDetailsBuilder& commandType(CommandType type);
    CommandDetailsBuilder& env(CommandDetails::EnvMap env);
    /// An empty string builds as "no pre-command"
    CommandDetailsBuilder& preCommand(std::string preCommand);
    CommandDetailsBuilder& clearPreCommand();
    CommandDetailsBuilder& params(std::vector<std::string> params);
    CommandDetailsBuilder& workingDirectory(std::filesystem::path dir);
    CommandDetailsBuilder& clearWorkingDirectory();
    CommandDetailsBuilder& allowMultipleInstances(bool allow);

    /// Register an owned validator
    CommandDetailsBuilder& addValidator(std::unique_ptr<Validator> validator);

    /// Register a closure returning Expected<void>
    CommandDetailsBuilder& addValidator(FunctionValidator::Fn fn);

    /// Register a pass/fail closure; a failure is reported with message
    CommandDetailsBuilder& addPredicate(PredicateValidator::Fn fn,
                                        std::string message = "validation failed");

    /// Number of validators registered so far
    size_t validatorCount() const { return validators.size(); }

    /**
     * @brief Assemble and validate the CommandDetails
     * @return The immutable value, or:
     *   - InvalidCommand if the command is empty or blank (or the builder was already spent)
     *   - ValidationFailed carrying the first failing validator's message
     */
    Expected<CommandDetails> build();

private:
    std::string commandLine;
    CommandType type;
    CommandDetails::EnvMap environment;
    std::optional<std::string> preCommandLine;
    std::vector<std::string> arguments;
    std::optional<std::filesystem::path> cwd;
    bool multipleInstances{false};
    std::vector<std::unique_ptr<Validator>> validators;
    bool consumed{false};
};

}

