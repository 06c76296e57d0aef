#pragma once

#include "common/progress_sink.hpp"
#include <cstdint>
#include <string>

struct TransferResult {
    bool success = false;
    std::string errorMessage;
    uint64_t bytesTransferred = 0;
    std::string remotePath;
};

// Uploads single files to one remote host. Implementations never throw
// from putFile; every failure is reported through TransferResult.
class FileTransport {
public:
    virtual ~FileTransport() = default;

    virtual TransferResult openSession(const std::string& host) = 0;
    virtual TransferResult putFile(const std::string& localPath, const std::string& remoteDir,
                                   ProgressSink& progress) = 0;
    virtual void closeSession() = 0;
};

// remoteDir joined with the file name of localPath.
std::string remoteFilePath(const std::string& remoteDir, const std::string& localPath);
