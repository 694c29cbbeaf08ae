#include "core/FileConfigStore.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/Constants.hpp"

namespace fs = std::filesystem;

namespace runcfg {

FileConfigStore::FileConfigStore(fs::path path) : filePath(std::move(path)) {}

fs::path FileConfigStore::resolvePath(const std::string& explicitPath) {
    if (!explicitPath.empty()) return explicitPath;
    const char* env = std::getenv(Constants::CONFIG_PATH_ENV);
    if (env && *env) return fs::path(env);
    return fs::current_path() / Constants::DEFAULT_CONFIG_FILE;
}

bool FileConfigStore::exists() const {
    std::error_code ec;
    return fs::is_regular_file(filePath, ec);
}

Expected<std::string> FileConfigStore::read() const {
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::ReadFailure, "cannot open " + filePath.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::ReadFailure, "failed reading " + filePath.string()};
    }
    return buffer.str();
}

Expected<void> FileConfigStore::write(const std::string& bytes) {
    fs::path tempPath = filePath.string() + ".tmp";

    std::error_code ec;
    if (filePath.has_parent_path()) {
        fs::create_directories(filePath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::WriteFailure, "cannot create " + filePath.parent_path().string() + ": " + ec.message()};
        }
    }

    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::WriteFailure, "cannot open " + tempPath.string()};
    }
    out << bytes;
    out.flush();
    if (!out.good()) {
        out.close();
        fs::remove(tempPath, ec);
        return Error{ErrorCode::WriteFailure, "failed writing " + tempPath.string()};
    }
    out.close();

    fs::rename(tempPath, filePath, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(tempPath, ec);
        return Error{ErrorCode::WriteFailure, "cannot replace " + filePath.string() + ": " + reason};
    }
    return {};
}

}
