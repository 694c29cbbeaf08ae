#pragma once

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/ConfigStore.hpp"
#include "util/Expected.hpp"

namespace runcfg {

/// Services handed to every command; owned by main()
struct AppContext {
    Config& config;       // Loaded at startup (defaults if the load failed and was tolerated)
    IConfigStore& store;  // Where mutating commands save
};

/// One row of a command's OPTIONS section
struct HelpOption {
    std::string flag;
    std::string text;
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;

    /**
     * @brief Whether the command refuses to run when the config failed to load
     *
     * Commands that only print help or replace the whole file override this
     * so a broken config can still be recovered from.
     */
    virtual bool requiresLoadedConfig() const { return true; }

    // Detailed help
    virtual const char* helpSynopsis() const = 0;      // usage line
    virtual const char* helpDescription() const = 0;   // paragraph
    virtual std::vector<HelpOption> helpOptions() const { return {}; }
};

}
