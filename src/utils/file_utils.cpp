#include "utils/file_utils.h"
#include "utils/logger.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace tickagg {

bool ensureDirectory(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);

    if (ec) {
        if (ec == std::errc::permission_denied) {
            LOG_ERROR("Cannot create directory " + path + " due to permission errors");
        } else {
            LOG_ERROR("Cannot create directory " + path + ": " + ec.message());
        }
        return false;
    }

    return fs::is_directory(path, ec);
}

} // namespace tickagg
