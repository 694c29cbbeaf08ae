#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace runcfg {

/**
 * @brief Registry of subcommand creators, keyed by the name typed on the command line
 *
 * Creators are kept sorted by name so that help output is stable.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Add or replace the creator for name
    void registerCreator(const std::string& name, Creator creator);

    /// New instance of the named command, or nullptr if none is registered
    std::unique_ptr<ICommand> create(const std::string& name) const;

    bool contains(const std::string& name) const;

    /// Registered names in sorted order
    std::vector<std::string> names() const;

    /// Register help, init, list, show, add, edit, set-default and remove (idempotent)
    void registerBuiltins();

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;
};

}
