#include <gtest/gtest.h>
#include "backup/backup_config.hpp"
#include "common/backup_errors.hpp"
#include "test_helpers.hpp"
#include <cstdlib>

TEST(BackupConfigTest, DefaultsMatchDocumentedValues) {
    BackupConfig config;
    EXPECT_EQ(config.chunkSize, 6ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(config.stagingDir, "/home/tmp/");
    EXPECT_EQ(config.host, "home_server");
    EXPECT_EQ(config.effectiveRemoteDir(), "/home/llucsm/backups/");
    EXPECT_EQ(config.hostKeyPolicy, HostKeyPolicy::Strict);
    EXPECT_FALSE(config.compress);
    EXPECT_EQ(config.mode(), BackupMode::ArchiveAndTransfer);
}

TEST(BackupConfigTest, ModeSelection) {
    BackupConfig config;
    config.archiveOnly = true;
    EXPECT_EQ(config.mode(), BackupMode::ArchiveOnly);

    config.archiveOnly = false;
    config.transferOnly = true;
    EXPECT_EQ(config.mode(), BackupMode::TransferOnly);

    config.archiveOnly = true;
    EXPECT_THROW(config.mode(), ConfigurationError);
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(BackupConfigTest, ValidateRejectsBadValues) {
    BackupConfig config;
    EXPECT_NO_THROW(config.validate());

    BackupConfig zeroChunk;
    zeroChunk.chunkSize = 0;
    EXPECT_THROW(zeroChunk.validate(), ConfigurationError);

    BackupConfig relativeRemote;
    relativeRemote.remoteDir = "backups";
    EXPECT_THROW(relativeRemote.validate(), ConfigurationError);

    BackupConfig noHost;
    noHost.host.clear();
    EXPECT_THROW(noHost.validate(), ConfigurationError);
    noHost.archiveOnly = true;
    EXPECT_NO_THROW(noHost.validate());

    BackupConfig badTimeout;
    badTimeout.connectTimeoutSeconds = 0;
    EXPECT_THROW(badTimeout.validate(), ConfigurationError);
}

TEST(BackupConfigTest, LoadsKnownKeys) {
    TempDir dir;
    writeFile(dir.file("config.json"), R"({
        "source": "/data/photos",
        "stagingDir": "/scratch",
        "partSize": 1048576,
        "gzip": true,
        "host": "nas",
        "remotePath": "/srv/backups",
        "hostKeyPolicy": "accept-new",
        "connectTimeoutSeconds": 5
    })");

    BackupConfig config;
    loadConfigFile(dir.file("config.json"), config, true);

    EXPECT_EQ(config.sourcePath, "/data/photos");
    EXPECT_EQ(config.stagingDir, "/scratch");
    EXPECT_EQ(config.chunkSize, 1048576u);
    EXPECT_TRUE(config.compress);
    EXPECT_EQ(config.host, "nas");
    EXPECT_EQ(config.effectiveRemoteDir(), "/srv/backups");
    EXPECT_EQ(config.hostKeyPolicy, HostKeyPolicy::AcceptNew);
    EXPECT_EQ(config.connectTimeoutSeconds, 5);
    // Untouched keys keep their defaults
    EXPECT_EQ(config.logFile, "backup.log");
}

TEST(BackupConfigTest, MissingFileHandling) {
    TempDir dir;
    BackupConfig config;
    EXPECT_NO_THROW(loadConfigFile(dir.file("absent.json"), config, false));
    EXPECT_EQ(config.host, "home_server");
    EXPECT_THROW(loadConfigFile(dir.file("absent.json"), config, true), ConfigurationError);
}

TEST(BackupConfigTest, MalformedFileIsConfigurationError) {
    TempDir dir;
    BackupConfig config;

    writeFile(dir.file("broken.json"), "{ \"host\": ");
    EXPECT_THROW(loadConfigFile(dir.file("broken.json"), config, false), ConfigurationError);

    writeFile(dir.file("array.json"), "[1, 2]");
    EXPECT_THROW(loadConfigFile(dir.file("array.json"), config, false), ConfigurationError);

    writeFile(dir.file("wrongtype.json"), R"({"partSize": "big"})");
    EXPECT_THROW(loadConfigFile(dir.file("wrongtype.json"), config, false), ConfigurationError);

    writeFile(dir.file("policy.json"), R"({"hostKeyPolicy": "yolo"})");
    EXPECT_THROW(loadConfigFile(dir.file("policy.json"), config, false), ConfigurationError);
}

TEST(BackupConfigTest, ExpandUser) {
    const char* home = std::getenv("HOME");
    ASSERT_NE(home, nullptr);

    EXPECT_EQ(expandUser("~"), std::string(home));
    EXPECT_EQ(expandUser("~/docs"), std::string(home) + "/docs");
    EXPECT_EQ(expandUser("/abs/~"), "/abs/~");
    EXPECT_EQ(expandUser("~other/x"), "~other/x");
    EXPECT_EQ(expandUser(""), "");
}

TEST(BackupConfigTest, HostKeyPolicyNames) {
    EXPECT_EQ(parseHostKeyPolicy("strict"), HostKeyPolicy::Strict);
    EXPECT_EQ(parseHostKeyPolicy("accept-new"), HostKeyPolicy::AcceptNew);
    EXPECT_THROW(parseHostKeyPolicy("Strict"), ConfigurationError);
    EXPECT_STREQ(hostKeyPolicyToString(HostKeyPolicy::AcceptNew), "accept-new");
    EXPECT_STREQ(modeToString(BackupMode::TransferOnly), "transfer-only");
}
