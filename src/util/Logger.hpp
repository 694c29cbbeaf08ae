#pragma once

#include <ostream>
#include <string>

namespace runcfg {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * The initial level comes from $RUNCFG_LOG (see parseLevel), defaulting to
 * Info. Error and Warn lines go to the diagnostic stream (std::cerr), Info
 * and Debug lines to the output stream (std::cout); both can be redirected.
 *
 * Line format: "[warn ] config: skipping run.app (missing command)"
 */
class Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level <= currentLevel; }

    void log(LogLevel level, const std::string& msg) const;
    void error(const std::string& msg) const { log(LogLevel::Error, msg); }
    void warn(const std::string& msg) const { log(LogLevel::Warn, msg); }
    void info(const std::string& msg) const { log(LogLevel::Info, msg); }
    void debug(const std::string& msg) const { log(LogLevel::Debug, msg); }

    /// Redirect output; nullptr restores the standard stream
    void setStreams(std::ostream* diagnostics, std::ostream* output);

    /// Parse "error|warn|info|debug" or "0".."3" (case-insensitive); unknown text yields Info
    static LogLevel parseLevel(const std::string& text);

    /// Five-character tag used in line prefixes ("error", "warn ", ...)
    static const char* levelTag(LogLevel level);

private:
    Logger();

    LogLevel currentLevel;
    std::ostream* diagStream;
    std::ostream* outStream;
};

}
