#include "core/CommandDetails.hpp"

#include <utility>

namespace runcfg {

CommandDetails::CommandDetails(std::string command, CommandType commandType)
    : commandLine(std::move(command)), type(commandType) {}

bool CommandDetails::operator==(const CommandDetails& other) const {
    return commandLine == other.commandLine &&
           type == other.type &&
           environment == other.environment &&
           preCommandLine == other.preCommandLine &&
           arguments == other.arguments &&
           cwd == other.cwd &&
           multipleInstances == other.multipleInstances;
}

}
