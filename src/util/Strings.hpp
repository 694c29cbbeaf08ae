#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runcfg {

/**
 * @brief Small string helpers shared by the document loader and the CLI
 */
namespace Strings {

/// Strip leading and trailing whitespace
std::string trim(const std::string& text);

/// True when text is empty or whitespace only
bool isBlank(const std::string& text);

/**
 * @brief Split on runs of whitespace, dropping empty pieces
 *
 * Example: "  --release  --bin app" -> {"--release", "--bin", "app"}
 */
std::vector<std::string> splitWhitespace(const std::string& text);

/**
 * @brief Split "NAME=VALUE" at the first '='
 * @return Pair of (name, value), or nullopt when there is no '=' or the name is blank
 *
 * The value may itself contain '=' and may be empty ("NAME=").
 */
std::optional<std::pair<std::string, std::string>> splitAssignment(const std::string& text);

}

}

