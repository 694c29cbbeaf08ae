#include "cli/CommandInvoker.hpp"

#include "cli/CommandFactory.hpp"
#include "util/Logger.hpp"

namespace runcfg {

namespace {

void report(const std::string& name, const Error& err) {
    Logger::instance().error(name + ": [" + errorCodeName(err.code) + "] " + err.message);
}

}

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    log.debug(std::string("running '") + cmd.name() + "' with " + std::to_string(args.size()) + " argument(s)");

    auto res = cmd.execute(ctx, args);
    if (!res) {
        report(cmd.name(), res.error());
        return res;
    }
    log.debug(std::string("'") + cmd.name() + "' finished");
    return {};
}

Expected<void> CommandInvoker::invoke(const std::string& name, const AppContext& ctx,
                                      const std::vector<std::string>& args) {
    auto cmd = CommandFactory::instance().create(name);
    if (!cmd) {
        Error err{ErrorCode::InvalidCommand, "unknown command '" + name + "' (see 'runcfg help')"};
        report("runcfg", err);
        return err;
    }
    return invoke(*cmd, ctx, args);
}

}
