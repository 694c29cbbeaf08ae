#include "cli/commands/HelpCommand.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace runcfg {

namespace {

void printManual(const ICommand& cmd) {
    std::cout << "NAME\n    " << cmd.name() << " - " << cmd.description() << "\n\n";
    std::cout << "SYNOPSIS\n    " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION\n    " << cmd.helpDescription() << "\n";

    auto opts = cmd.helpOptions();
    if (opts.empty()) return;

    size_t width = 0;
    for (const auto& opt : opts) width = std::max(width, opt.flag.size());
    std::cout << "\nOPTIONS\n";
    for (const auto& opt : opts) {
        std::cout << "    " << std::left << std::setw(static_cast<int>(width)) << opt.flag
                  << "  " << opt.text << "\n";
    }
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    const CommandFactory& factory = CommandFactory::instance();

    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "help: usage: runcfg help [<command>]"};
    }
    if (args.size() == 1) {
        auto cmd = factory.create(args.front());
        if (!cmd) {
            return Error{ErrorCode::InvalidArgs, "help: unknown command '" + args.front() + "'"};
        }
        printManual(*cmd);
        return {};
    }

    std::vector<std::string> names = factory.names();
    size_t width = 0;
    for (const auto& n : names) width = std::max(width, n.size());

    std::cout << "usage: runcfg [--config <path>] [-v] <command> [<args>]\n\n";
    std::cout << "Commands:\n";
    for (const auto& n : names) {
        auto cmd = factory.create(n);
        if (!cmd) continue;
        std::cout << "  " << std::left << std::setw(static_cast<int>(width)) << n
                  << "  " << cmd->description() << "\n";
    }
    std::cout << "\nConfig file: " << ctx.store.location() << "\n";
    std::cout << "See 'runcfg help <command>' for the options of one command.\n";
    return {};
}

}
