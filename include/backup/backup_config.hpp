#pragma once

#include <cstdint>
#include <string>

constexpr uint64_t kDefaultChunkSize = 6ULL * 1024 * 1024 * 1024;  // 6 GiB
constexpr const char* kDefaultStagingDir = "/home/tmp/";
constexpr const char* kDefaultHost = "home_server";
constexpr const char* kDefaultRemoteDir = "/home/llucsm/backups/";
constexpr const char* kDefaultLogFile = "backup.log";

enum class BackupMode {
    ArchiveAndTransfer,
    ArchiveOnly,
    TransferOnly
};

enum class HostKeyPolicy {
    Strict,     // unknown host keys are rejected
    AcceptNew   // first-seen keys are trusted and written to known_hosts
};

struct BackupConfig {
    std::string sourcePath = "~";
    std::string stagingDir = kDefaultStagingDir;
    uint64_t chunkSize = kDefaultChunkSize;
    bool compress = false;
    std::string host = kDefaultHost;
    std::string remoteDir;  // empty means kDefaultRemoteDir
    bool archiveOnly = false;
    bool transferOnly = false;
    bool removeTransferred = false;  // also delete uploaded chunks in transfer-only mode
    bool verbose = false;

    std::string logFile = kDefaultLogFile;
    std::string knownHostsFile;  // empty means ~/.ssh/known_hosts
    std::string sshConfigFile;   // empty means ~/.ssh/config
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::Strict;
    long connectTimeoutSeconds = 30;

    // Throws ConfigurationError when both archiveOnly and transferOnly are set.
    BackupMode mode() const;

    // Throws ConfigurationError on any invalid value.
    void validate() const;

    std::string effectiveRemoteDir() const;
};

// Replaces a leading "~" with $HOME.
std::string expandUser(const std::string& path);

// Default config location: $XDG_CONFIG_HOME/chunkferry/config.json or
// ~/.config/chunkferry/config.json.
std::string defaultConfigFilePath();

// Applies the keys found in a JSON config file on top of config.
// A missing file is ignored unless required is set. Malformed content
// throws ConfigurationError.
void loadConfigFile(const std::string& path, BackupConfig& config, bool required);

const char* modeToString(BackupMode mode);
const char* hostKeyPolicyToString(HostKeyPolicy policy);
HostKeyPolicy parseHostKeyPolicy(const std::string& value);
