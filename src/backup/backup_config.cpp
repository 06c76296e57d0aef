#include "backup/backup_config.hpp"
#include "common/backup_errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

BackupMode BackupConfig::mode() const {
    if (archiveOnly && transferOnly) {
        throw ConfigurationError("Cannot use both --transfer-only and --compress-only options");
    }
    if (transferOnly) {
        return BackupMode::TransferOnly;
    }
    if (archiveOnly) {
        return BackupMode::ArchiveOnly;
    }
    return BackupMode::ArchiveAndTransfer;
}

void BackupConfig::validate() const {
    BackupMode m = mode();
    if (chunkSize == 0) {
        throw ConfigurationError("Part size must be a positive number of bytes");
    }
    if (stagingDir.empty()) {
        throw ConfigurationError("Staging directory must not be empty");
    }
    if (m != BackupMode::TransferOnly && sourcePath.empty()) {
        throw ConfigurationError("Source directory must not be empty");
    }
    if (m != BackupMode::ArchiveOnly && host.empty()) {
        throw ConfigurationError("Destination host must not be empty");
    }
    if (!remoteDir.empty() && remoteDir.front() != '/') {
        throw ConfigurationError("Remote path must be absolute: " + remoteDir);
    }
    if (connectTimeoutSeconds <= 0) {
        throw ConfigurationError("Connect timeout must be positive");
    }
}

std::string BackupConfig::effectiveRemoteDir() const {
    return remoteDir.empty() ? std::string(kDefaultRemoteDir) : remoteDir;
}

std::string expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user forms are left alone
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string defaultConfigFilePath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path base;
    if (xdg && *xdg) {
        base = xdg;
    } else {
        base = std::filesystem::path(expandUser("~")) / ".config";
    }
    return (base / "chunkferry" / "config.json").string();
}

void loadConfigFile(const std::string& path, BackupConfig& config, bool required) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (required) {
            throw ConfigurationError("Cannot open config file: " + path);
        }
        return;
    }

    try {
        json doc;
        file >> doc;
        if (!doc.is_object()) {
            throw ConfigurationError("Config file must contain a JSON object: " + path);
        }

        if (doc.contains("source")) config.sourcePath = doc["source"].get<std::string>();
        if (doc.contains("stagingDir")) config.stagingDir = doc["stagingDir"].get<std::string>();
        if (doc.contains("partSize")) config.chunkSize = doc["partSize"].get<uint64_t>();
        if (doc.contains("gzip")) config.compress = doc["gzip"].get<bool>();
        if (doc.contains("host")) config.host = doc["host"].get<std::string>();
        if (doc.contains("remotePath")) config.remoteDir = doc["remotePath"].get<std::string>();
        if (doc.contains("logFile")) config.logFile = doc["logFile"].get<std::string>();
        if (doc.contains("knownHostsFile")) config.knownHostsFile = doc["knownHostsFile"].get<std::string>();
        if (doc.contains("sshConfigFile")) config.sshConfigFile = doc["sshConfigFile"].get<std::string>();
        if (doc.contains("hostKeyPolicy")) {
            config.hostKeyPolicy = parseHostKeyPolicy(doc["hostKeyPolicy"].get<std::string>());
        }
        if (doc.contains("connectTimeoutSeconds")) {
            config.connectTimeoutSeconds = doc["connectTimeoutSeconds"].get<long>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid config file " + path + ": " + e.what());
    }
}

const char* modeToString(BackupMode mode) {
    switch (mode) {
        case BackupMode::ArchiveAndTransfer: return "archive-and-transfer";
        case BackupMode::ArchiveOnly:        return "archive-only";
        case BackupMode::TransferOnly:       return "transfer-only";
        default:                             return "unknown";
    }
}

const char* hostKeyPolicyToString(HostKeyPolicy policy) {
    return policy == HostKeyPolicy::AcceptNew ? "accept-new" : "strict";
}

HostKeyPolicy parseHostKeyPolicy(const std::string& value) {
    if (value == "strict") {
        return HostKeyPolicy::Strict;
    }
    if (value == "accept-new") {
        return HostKeyPolicy::AcceptNew;
    }
    throw ConfigurationError("Unknown host key policy: " + value);
}
