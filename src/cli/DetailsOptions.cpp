#include "cli/DetailsOptions.hpp"

#include "util/Strings.hpp"

namespace runcfg {

Expected<DetailsOptions> parseDetailsOptions(const std::vector<std::string>& args, const std::string& cmdName,
                                             bool acceptDefault) {
    DetailsOptions opts;

    // Flags that consume the following argument
    auto valueOf = [&](size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) return std::nullopt;
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a.rfind("--", 0) != 0) {
            opts.positional.push_back(a);
            continue;
        }

        if (a == "--clear-params") {
            opts.clearParams = true;
        } else if (a == "--clear-cwd") {
            opts.clearCwd = true;
        } else if (a == "--clear-pre") {
            opts.clearPre = true;
        } else if (a == "--allow-multiple") {
            opts.allowMultiple = true;
        } else if (a == "--single-instance") {
            opts.allowMultiple = false;
        } else if (acceptDefault && a == "--default") {
            opts.makeDefault = true;
        } else if (a == "--command" || a == "--type" || a == "--param" || a == "--params" ||
                   a == "--env" || a == "--unset-env" || a == "--cwd" || a == "--pre") {
            auto v = valueOf(i);
            if (!v) return Error{ErrorCode::InvalidArgs, cmdName + ": " + a + " requires a value"};

            if (a == "--command") {
                opts.command = *v;
            } else if (a == "--type") {
                auto type = parseCommandType(*v);
                if (!type) return Error{ErrorCode::InvalidArgs, cmdName + ": unknown command type '" + *v + "'"};
                opts.type = *type;
            } else if (a == "--param") {
                if (!opts.params) opts.params.emplace();
                opts.params->push_back(*v);
            } else if (a == "--params") {
                if (!opts.params) opts.params.emplace();
                for (auto& p : Strings::splitWhitespace(*v)) opts.params->push_back(p);
            } else if (a == "--env") {
                auto kv = Strings::splitAssignment(*v);
                if (!kv) return Error{ErrorCode::InvalidArgs, cmdName + ": --env expects NAME=VALUE, got '" + *v + "'"};
                opts.envSet.push_back(*kv);
            } else if (a == "--unset-env") {
                opts.envUnset.push_back(*v);
            } else if (a == "--cwd") {
                opts.cwd = *v;
            } else {
                opts.pre = *v;
            }
        } else {
            return Error{ErrorCode::InvalidArgs, cmdName + ": unknown option " + a};
        }
    }
    return opts;
}

void applyDetailsOptions(const DetailsOptions& opts, const CommandDetails::EnvMap& baseEnv,
                         CommandDetailsBuilder& builder) {
    if (opts.command) builder.command(*opts.command);
    if (opts.type) builder.commandType(*opts.type);

    if (opts.clearParams) builder.params({});
    if (opts.params) builder.params(*opts.params);

    if (!opts.envSet.empty() || !opts.envUnset.empty()) {
        CommandDetails::EnvMap env = baseEnv;
        for (const auto& name : opts.envUnset) env.erase(name);
        for (const auto& [name, value] : opts.envSet) env[name] = value;
        builder.env(std::move(env));
    }

    if (opts.clearCwd) builder.clearWorkingDirectory();
    if (opts.cwd) builder.workingDirectory(*opts.cwd);

    if (opts.clearPre) builder.clearPreCommand();
    if (opts.pre) {
        if (opts.pre->empty()) builder.clearPreCommand();
        else builder.preCommand(*opts.pre);
    }

    if (opts.allowMultiple) builder.allowMultipleInstances(*opts.allowMultiple);
}

void printDetails(std::ostream& os, const CommandDetails& details, const std::string& indent) {
    os << indent << "command:   " << details.command() << "\n";
    os << indent << "type:      " << toString(details.commandType()) << "\n";
    if (!details.params().empty()) {
        os << indent << "params:   ";
        for (const auto& p : details.params()) os << " " << p;
        os << "\n";
    }
    for (const auto& [name, value] : details.env()) {
        os << indent << "env:       " << name << "=" << value << "\n";
    }
    if (details.preCommand()) os << indent << "pre:       " << *details.preCommand() << "\n";
    if (details.workingDirectory()) os << indent << "cwd:       " << details.workingDirectory()->string() << "\n";
    os << indent << "multiple:  " << (details.allowMultipleInstances() ? "yes" : "no") << "\n";
}

}
