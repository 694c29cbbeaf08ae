#pragma once

#include <optional>
#include <string>
#include <utility>

namespace runcfg {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    InvalidCommand,
    ValidationFailed,
    NotFound,
    ContextNotFound,
    ConfigKeyNotFound,
    NoDefaultConfigured,
    NoConfigForContext,
    ParseFailure,
    ReadFailure,
    WriteFailure,
    AlreadyInitialized
};

/// Stable lowercase name of an error code (used in log lines)
const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : value_(value) {}
    Expected(T&& value) : value_(std::move(value)) {}
    Expected(const Error& err) : error_(err) {}
    Expected(Error&& err) : error_(std::move(err)) {}

    bool has_value() const { return value_.has_value(); }
    explicit operator bool() const { return value_.has_value(); }
    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const Error& error() const { return error_; }

private:
    std::optional<T> value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}

