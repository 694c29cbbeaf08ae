#include "core/CommandType.hpp"

#include <algorithm>
#include <cctype>

#include "util/Strings.hpp"

namespace runcfg {

const char* toString(CommandType type) {
    switch (type) {
        case CommandType::Cargo: return "cargo";
        case CommandType::Shell: return "shell";
    }
    return "shell";
}

std::optional<CommandType> parseCommandType(const std::string& text) {
    std::string v = Strings::trim(text);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "cargo") return CommandType::Cargo;
    if (v == "shell") return CommandType::Shell;
    return std::nullopt;
}

}
