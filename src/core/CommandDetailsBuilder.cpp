#include "core/CommandDetailsBuilder.hpp"

#include <utility>

#include "util/Strings.hpp"

namespace runcfg {

CommandDetailsBuilder::CommandDetailsBuilder(std::string command, CommandType commandType)
    : commandLine(std::move(command)), type(commandType) {}

CommandDetailsBuilder CommandDetailsBuilder::from(const CommandDetails& details) {
    CommandDetailsBuilder b(details.command(), details.commandType());
    b.environment = details.env();
    b.preCommandLine = details.preCommand();
    b.arguments = details.params();
    b.cwd = details.workingDirectory();
    b.multipleInstances = details.allowMultipleInstances();
    return b;
}

CommandDetailsBuilder& CommandDetailsBuilder::command(std::string command) {
    commandLine = std::move(command);
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::commandType(CommandType t) {
    type = t;
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::env(CommandDetails::EnvMap env) {
    environment = std::move(env);
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::preCommand(std::string preCommand) {
    preCommandLine = std::move(preCommand);
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::clearPreCommand() {
    preCommandLine.reset();
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::params(std::vector<std::string> params) {
    arguments = std::move(params);
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::workingDirectory(std::filesystem::path dir) {
    cwd = std::move(dir);
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::clearWorkingDirectory() {
    cwd.reset();
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::allowMultipleInstances(bool allow) {
    multipleInstances = allow;
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::addValidator(std::unique_ptr<Validator> validator) {
    if (validator) validators.push_back(std::move(validator));
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::addValidator(FunctionValidator::Fn fn) {
    validators.push_back(std::make_unique<FunctionValidator>(std::move(fn)));
    return *this;
}

CommandDetailsBuilder& CommandDetailsBuilder::addPredicate(PredicateValidator::Fn fn, std::string message) {
    validators.push_back(std::make_unique<PredicateValidator>(std::move(fn), std::move(message)));
    return *this;
}

Expected<CommandDetails> CommandDetailsBuilder::build() {
    if (consumed) {
        return Error{ErrorCode::InvalidCommand, "builder already consumed"};
    }
    consumed = true;

    // Release validators on every path out of build()
    auto checks = std::move(validators);
    validators.clear();

    if (Strings::isBlank(commandLine)) {
        return Error{ErrorCode::InvalidCommand, "command must not be empty"};
    }

    // An empty pre-command or working directory means "not set"
    if (preCommandLine && preCommandLine->empty()) preCommandLine.reset();
    if (cwd && cwd->empty()) cwd.reset();

    CommandDetails details(std::move(commandLine), type);
    details.environment = std::move(environment);
    details.preCommandLine = std::move(preCommandLine);
    details.arguments = std::move(arguments);
    details.cwd = std::move(cwd);
    details.multipleInstances = multipleInstances;

    for (const auto& v : checks) {
        auto res = v->validate(details);
        if (!res) {
            std::string msg = res.error().message.empty() ? "validation failed" : res.error().message;
            return Error{ErrorCode::ValidationFailed, msg};
        }
    }
    return details;
}

}
