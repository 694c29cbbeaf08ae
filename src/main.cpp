// runcfg: load the config once, run one subcommand, exit 0 on success and 1 otherwise.

#include <cstddef>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/GlobalOptions.hpp"
#include "cli/ICommand.hpp"
#include "core/Config.hpp"
#include "core/FileConfigStore.hpp"
#include "util/Logger.hpp"

using namespace runcfg;

int main(int argc, char** argv) {
    CommandFactory& factory = CommandFactory::instance();
    factory.registerBuiltins();

    std::vector<std::string> args(argv + 1, argv + argc);

    auto global = parseGlobalOptions(args);
    if (!global) {
        std::cerr << "runcfg: " << global.error().message << "\n";
        return 1;
    }
    if (global.value().verbose) Logger::instance().setLevel(LogLevel::Debug);
    const std::string& configPath = global.value().configPath;
    size_t pos = global.value().consumed;

    std::string cmdName = pos < args.size() ? args[pos++] : "help";
    std::vector<std::string> cmdArgs(args.begin() + static_cast<std::ptrdiff_t>(pos), args.end());

    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "runcfg: '" << cmdName << "' is not a runcfg command. See 'runcfg help'.\n";
        return 1;
    }

    FileConfigStore store(FileConfigStore::resolvePath(configPath));
    Config config;
    auto loaded = Config::load(store);
    if (loaded) {
        config = std::move(loaded.value());
    } else if (!cmd->requiresLoadedConfig()) {
        Logger::instance().warn(loaded.error().message);
    } else {
        Logger::instance().error(std::string("[") + errorCodeName(loaded.error().code) + "] " +
                                 loaded.error().message);
        return 1;
    }

    AppContext ctx{config, store};
    CommandInvoker invoker;
    return invoker.invoke(*cmd, ctx, cmdArgs) ? 0 : 1;
}
