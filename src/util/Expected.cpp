#include "util/Expected.hpp"

namespace runcfg {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::InvalidCommand: return "invalid-command";
        case ErrorCode::ValidationFailed: return "validation-failed";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::ContextNotFound: return "context-not-found";
        case ErrorCode::ConfigKeyNotFound: return "config-key-not-found";
        case ErrorCode::NoDefaultConfigured: return "no-default-configured";
        case ErrorCode::NoConfigForContext: return "no-config-for-context";
        case ErrorCode::ParseFailure: return "parse-failure";
        case ErrorCode::ReadFailure: return "read-failure";
        case ErrorCode::WriteFailure: return "write-failure";
        case ErrorCode::AlreadyInitialized: return "already-initialized";
    }
    return "unknown";
}

}
