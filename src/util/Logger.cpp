#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

#include "util/Strings.hpp"

namespace runcfg {

namespace {

constexpr const char* LOG_LEVEL_ENV = "RUNCFG_LOG";

LogLevel levelFromEnvironment() {
    const char* env = std::getenv(LOG_LEVEL_ENV);
    return env ? Logger::parseLevel(env) : LogLevel::Info;
}

}

LogLevel Logger::parseLevel(const std::string& text) {
    std::string v = Strings::trim(text);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "warning" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

const char* Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn ";
        case LogLevel::Info: return "info ";
        case LogLevel::Debug: return "debug";
    }
    return "info ";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(levelFromEnvironment()), diagStream(nullptr), outStream(nullptr) {}

void Logger::setLevel(LogLevel level) { currentLevel = level; }
LogLevel Logger::level() const { return currentLevel; }

void Logger::setStreams(std::ostream* diagnostics, std::ostream* output) {
    diagStream = diagnostics;
    outStream = output;
}

void Logger::log(LogLevel level, const std::string& msg) const {
    if (!enabled(level)) return;
    std::ostream& os = level <= LogLevel::Warn ? (diagStream ? *diagStream : std::cerr)
                                               : (outStream ? *outStream : std::cout);
    os << "[" << levelTag(level) << "] " << msg << "\n";
}

}
