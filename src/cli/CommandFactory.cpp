#include "cli/CommandFactory.hpp"

#include <utility>

#include "cli/commands/AddCommand.hpp"
#include "cli/commands/EditCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"
#include "cli/commands/ListCommand.hpp"
#include "cli/commands/RemoveCommand.hpp"
#include "cli/commands/SetDefaultCommand.hpp"
#include "cli/commands/ShowCommand.hpp"

namespace runcfg {

namespace {

template <typename T>
CommandFactory::Creator creatorFor() {
    return [] { return std::make_unique<T>(); };
}

}

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end() || !it->second) return nullptr;
    return it->second();
}

bool CommandFactory::contains(const std::string& name) const {
    return creators.count(name) != 0;
}

std::vector<std::string> CommandFactory::names() const {
    std::vector<std::string> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) out.push_back(kv.first);
    return out;
}

void CommandFactory::registerBuiltins() {
    registerCreator("help", creatorFor<HelpCommand>());
    registerCreator("init", creatorFor<InitCommand>());
    registerCreator("list", creatorFor<ListCommand>());
    registerCreator("show", creatorFor<ShowCommand>());
    registerCreator("add", creatorFor<AddCommand>());
    registerCreator("edit", creatorFor<EditCommand>());
    registerCreator("set-default", creatorFor<SetDefaultCommand>());
    registerCreator("remove", creatorFor<RemoveCommand>());
}

}
