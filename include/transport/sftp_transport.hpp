#pragma once

#include "backup/backup_config.hpp"
#include "transport/file_transport.hpp"
#include "transport/ssh_host_config.hpp"
#include <curl/curl.h>
#include <string>

struct SftpOptions {
    std::string sshConfigFile;   // empty means ~/.ssh/config
    std::string knownHostsFile;  // empty means ~/.ssh/known_hosts
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::Strict;
    long connectTimeoutSeconds = 30;
};

// SFTP uploads through libcurl, authenticated with the caller's ssh-agent
// or key files.
class SftpTransport : public FileTransport {
public:
    explicit SftpTransport(const SftpOptions& options);
    ~SftpTransport() override;

    SftpTransport(const SftpTransport&) = delete;
    SftpTransport& operator=(const SftpTransport&) = delete;

    TransferResult openSession(const std::string& host) override;
    TransferResult putFile(const std::string& localPath, const std::string& remoteDir,
                           ProgressSink& progress) override;
    void closeSession() override;

    bool isOpen() const { return curl_ != nullptr; }
    const SshHostEntry& hostEntry() const { return host_; }
    std::string buildUrl(const std::string& remotePath) const;

private:
    struct ProgressContext {
        ProgressSink* sink;
        uint64_t total;
        uint64_t reported;
    };

    uint64_t upload(const std::string& localPath, const std::string& remotePath, ProgressSink& progress);

    static int keyCallback(CURL* easy, const struct curl_khkey* knownKey, const struct curl_khkey* foundKey,
                           enum curl_khmatch match, void* clientp);
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);

    SftpOptions options_;
    SshHostEntry host_;
    CURL* curl_;
    char errorBuffer_[CURL_ERROR_SIZE];
};
