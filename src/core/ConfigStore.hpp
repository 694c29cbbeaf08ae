#pragma once

#include <string>

#include "util/Expected.hpp"

namespace runcfg {

/**
 * @brief Persistence collaborator for Config
 *
 * Supplies the raw document bytes to Config::load() and accepts the bytes
 * produced by Config::save(). Implementations decide where the bytes live.
 */
class IConfigStore {
public:
    virtual ~IConfigStore() = default;

    /// True when a previously written document is available
    virtual bool exists() const = 0;

    /// Whole document text; ReadFailure on I/O problems
    virtual Expected<std::string> read() const = 0;

    /// Replace the document; WriteFailure on I/O problems
    virtual Expected<void> write(const std::string& bytes) = 0;

    /// Human-readable location for messages (e.g., a file path)
    virtual std::string location() const = 0;
};

}

