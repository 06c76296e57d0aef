#include "transport/sftp_transport.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

SftpTransport::SftpTransport(const SftpOptions& options)
    : options_(options)
    , curl_(nullptr) {
    curl_global_init(CURL_GLOBAL_ALL);
    errorBuffer_[0] = '\0';
    if (options_.sshConfigFile.empty()) {
        options_.sshConfigFile = defaultSshConfigPath();
    }
    if (options_.knownHostsFile.empty()) {
        options_.knownHostsFile = defaultKnownHostsPath();
    }
}

SftpTransport::~SftpTransport() {
    closeSession();
    curl_global_cleanup();
}

TransferResult SftpTransport::openSession(const std::string& host) {
    TransferResult result;
    closeSession();

    host_ = SshHostConfig::resolve(options_.sshConfigFile, host);
    if (host_.user.empty()) {
        const char* user = std::getenv("USER");
        if (!user) {
            user = std::getenv("LOGNAME");
        }
        host_.user = user ? user : "";
    }

    curl_ = curl_easy_init();
    if (!curl_) {
        result.errorMessage = "Failed to initialize CURL";
        Logger::error(result.errorMessage);
        return result;
    }

    if (options_.hostKeyPolicy == HostKeyPolicy::AcceptNew) {
        Logger::warning("Unknown host keys will be trusted and added to " + options_.knownHostsFile);
    }

    Logger::info("Prepared SFTP session to " + host + " (" + host_.user + "@" + host_.hostName + ":" +
                 std::to_string(host_.port) + ")");
    result.success = true;
    return result;
}

void SftpTransport::closeSession() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
        Logger::debug("SFTP session to " + host_.alias + " closed");
    }
}

std::string SftpTransport::buildUrl(const std::string& remotePath) const {
    std::string url = "sftp://" + host_.hostName;
    if (host_.port != 22) {
        url += ":" + std::to_string(host_.port);
    }
    if (remotePath.empty() || remotePath.front() != '/') {
        url += "/";
    }
    return url + utils::urlEncodePath(remotePath);
}

TransferResult SftpTransport::putFile(const std::string& localPath, const std::string& remoteDir,
                                      ProgressSink& progress) {
    TransferResult result;
    result.remotePath = remoteFilePath(remoteDir, localPath);

    try {
        if (!curl_) {
            throw TransferError("No open SFTP session");
        }
        result.bytesTransferred = upload(localPath, result.remotePath, progress);
        result.success = true;
    } catch (const std::exception& e) {
        result.errorMessage = e.what();
        Logger::error("Error transferring file " + std::filesystem::path(localPath).filename().string() +
                      " to " + host_.alias + ":" + result.remotePath + ": " + result.errorMessage);
    }
    return result;
}

uint64_t SftpTransport::upload(const std::string& localPath, const std::string& remotePath, ProgressSink& progress) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        throw TransferError("Local file does not exist: " + localPath);
    }
    uint64_t fileSize = std::filesystem::file_size(localPath, ec);
    if (ec) {
        throw TransferError("Cannot stat " + localPath + ": " + ec.message());
    }

    FILE* file = fopen(localPath.c_str(), "rb");
    if (!file) {
        throw TransferError("Cannot open " + localPath + ": " + std::strerror(errno));
    }

    std::string url = buildUrl(remotePath);
    ProgressContext context{&progress, fileSize, 0};
    errorBuffer_[0] = '\0';

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERNAME, host_.user.c_str());
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl_, CURLOPT_READDATA, file);
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(fileSize));
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);

    // Ambient credentials only: agent first, then key files
    curl_easy_setopt(curl_, CURLOPT_SSH_AUTH_TYPES, static_cast<long>(CURLSSH_AUTH_AGENT | CURLSSH_AUTH_PUBLICKEY));
    if (!host_.identityFile.empty()) {
        curl_easy_setopt(curl_, CURLOPT_SSH_PRIVATE_KEYFILE, host_.identityFile.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_SSH_KNOWNHOSTS, options_.knownHostsFile.c_str());
    curl_easy_setopt(curl_, CURLOPT_SSH_KEYFUNCTION, keyCallback);
    curl_easy_setopt(curl_, CURLOPT_SSH_KEYDATA, this);

    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &context);

    Logger::debug("Uploading " + localPath + " to " + url);
    progress.begin(std::filesystem::path(localPath).filename().string(), fileSize);

    CURLcode res = curl_easy_perform(curl_);
    fclose(file);

    if (res != CURLE_OK) {
        progress.end(false);
        std::string detail = errorBuffer_[0] ? std::string(": ") + errorBuffer_ : "";
        throw TransferError(std::string(curl_easy_strerror(res)) + detail);
    }

    curl_off_t uploaded = 0;
    curl_easy_getinfo(curl_, CURLINFO_SIZE_UPLOAD_T, &uploaded);
    if (static_cast<uint64_t>(uploaded) != fileSize) {
        progress.end(false);
        throw TransferError("Short upload: " + std::to_string(uploaded) + " of " +
                            std::to_string(fileSize) + " bytes");
    }

    if (context.reported < fileSize) {
        progress.update(fileSize, fileSize);
    }
    progress.end(true);
    return fileSize;
}

int SftpTransport::keyCallback(CURL* /*easy*/, const struct curl_khkey* /*knownKey*/,
                               const struct curl_khkey* /*foundKey*/, enum curl_khmatch match, void* clientp) {
    auto* self = static_cast<SftpTransport*>(clientp);
    switch (match) {
        case CURLKHMATCH_OK:
            return CURLKHSTAT_FINE;
        case CURLKHMATCH_MISSING:
            if (self->options_.hostKeyPolicy == HostKeyPolicy::AcceptNew) {
                Logger::warning("Trusting first-seen host key of " + self->host_.hostName);
                return CURLKHSTAT_FINE_ADD_TO_FILE;
            }
            Logger::error("Host key of " + self->host_.hostName + " is not in " + self->options_.knownHostsFile +
                          " (use --accept-new-host-keys to trust it)");
            return CURLKHSTAT_REJECT;
        case CURLKHMATCH_MISMATCH:
        default:
            Logger::error("Host key of " + self->host_.hostName + " does not match " + self->options_.knownHostsFile);
            return CURLKHSTAT_REJECT;
    }
}

int SftpTransport::progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                    curl_off_t ultotal, curl_off_t ulnow) {
    auto* context = static_cast<ProgressContext*>(clientp);
    uint64_t now = ulnow > 0 ? static_cast<uint64_t>(ulnow) : 0;
    uint64_t total = ultotal > 0 ? static_cast<uint64_t>(ultotal) : context->total;

    // libcurl repeats values between chunks of data; report only advances
    if (now > context->reported) {
        context->reported = now;
        context->sink->update(now, total);
    }
    return 0;
}
