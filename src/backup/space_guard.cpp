#include "backup/space_guard.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>
#include <unistd.h>

uint64_t SpaceGuard::availableBytes(const std::string& path) {
    std::error_code ec;
    std::filesystem::space_info info = std::filesystem::space(path, ec);
    if (ec) {
        throw EnvironmentError("Cannot query free space of " + path + ": " + ec.message());
    }
    return info.available;
}

void SpaceGuard::check(const std::string& stagingDir, uint64_t requiredBytes) {
    std::error_code ec;
    if (!std::filesystem::is_directory(stagingDir, ec)) {
        Logger::error("Directory " + stagingDir + " does not exist");
        throw EnvironmentError("Directory " + stagingDir + " does not exist");
    }

    if (access(stagingDir.c_str(), W_OK) != 0) {
        Logger::error("No write permission in " + stagingDir);
        throw EnvironmentError("No write permission in " + stagingDir);
    }

    uint64_t available = availableBytes(stagingDir);
    if (available < requiredBytes) {
        std::string message = "Not enough free space in " + stagingDir +
                              ". Free: " + std::to_string(available) +
                              ", Required: " + std::to_string(requiredBytes);
        Logger::error(message);
        throw EnvironmentError(message);
    }

    Logger::info("Staging directory " + stagingDir + " OK, " +
                 std::to_string(available) + " bytes free");
}
