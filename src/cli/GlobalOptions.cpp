#include "cli/GlobalOptions.hpp"

namespace runcfg {

Expected<GlobalOptions> parseGlobalOptions(const std::vector<std::string>& args) {
    GlobalOptions opts;
    size_t pos = 0;
    for (; pos < args.size() && args[pos].rfind("-", 0) == 0; ++pos) {
        const std::string& flag = args[pos];
        if (flag == "-v" || flag == "--verbose") {
            opts.verbose = true;
        } else if (flag == "--config") {
            if (pos + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "--config requires a path"};
            }
            opts.configPath = args[++pos];
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option " + flag};
        }
    }
    opts.consumed = pos;
    return opts;
}

}
