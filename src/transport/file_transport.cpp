#include "transport/file_transport.hpp"
#include <filesystem>

std::string remoteFilePath(const std::string& remoteDir, const std::string& localPath) {
    std::string fileName = std::filesystem::path(localPath).filename().string();
    if (remoteDir.empty()) {
        return fileName;
    }
    if (remoteDir.back() == '/') {
        return remoteDir + fileName;
    }
    return remoteDir + "/" + fileName;
}
