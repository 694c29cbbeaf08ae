#pragma once

#include <filesystem>
#include <string>

#include "core/ConfigStore.hpp"

namespace runcfg {

/**
 * @brief IConfigStore backed by a single file
 *
 * Writes go to "<path>.tmp" first and are renamed over the target only when
 * the write succeeded, so a failed save never truncates the existing file.
 * Missing parent directories are created on write.
 */
class FileConfigStore : public IConfigStore {
public:
    explicit FileConfigStore(std::filesystem::path path);

    /**
     * @brief Resolve the config file location
     * @param explicitPath Value of --config, empty when not given
     * @return explicitPath, else $RUNCFG_CONFIG, else ./.runcfg.yaml
     */
    static std::filesystem::path resolvePath(const std::string& explicitPath);

    bool exists() const override;
    Expected<std::string> read() const override;
    Expected<void> write(const std::string& bytes) override;
    std::string location() const override { return filePath.string(); }

    const std::filesystem::path& path() const { return filePath; }

private:
    std::filesystem::path filePath;
};

}

