#include "util/Strings.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace runcfg {
namespace Strings {

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text) {
    auto first = std::find_if_not(text.begin(), text.end(), isSpace);
    auto last = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    if (first >= last) return std::string();
    return std::string(first, last);
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), isSpace);
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        out.push_back(word);
    }
    return out;
}

std::optional<std::pair<std::string, std::string>> splitAssignment(const std::string& text) {
    auto pos = text.find('=');
    if (pos == std::string::npos) return std::nullopt;
    std::string name = trim(text.substr(0, pos));
    if (name.empty()) return std::nullopt;
    return std::make_pair(name, text.substr(pos + 1));
}

}
}
