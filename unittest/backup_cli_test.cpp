#include <gtest/gtest.h>
#include "backup/backup_cli.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Holds argv storage for one invocation
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "chunkferry");
        for (auto& arg : storage_) {
            pointers_.push_back(&arg[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

class BackupCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* previous = std::getenv("XDG_CONFIG_HOME");
        hadXdg_ = previous != nullptr;
        if (hadXdg_) {
            previousXdg_ = previous;
        }
        setenv("XDG_CONFIG_HOME", configHome_.path().c_str(), 1);
    }

    void TearDown() override {
        if (hadXdg_) {
            setenv("XDG_CONFIG_HOME", previousXdg_.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
        Logger::shutdown();
    }

    BackupConfig parse(std::initializer_list<std::string> list) {
        Args args(list);
        BackupConfig config;
        EXPECT_TRUE(BackupCLI::parseArguments(args.argc(), args.argv(), config));
        return config;
    }

    TempDir configHome_;
    bool hadXdg_ = false;
    std::string previousXdg_;
};

TEST_F(BackupCLITest, ParsesShortAndLongFlags) {
    BackupConfig config = parse({"-v", "-z", "-c", "-s", "/data", "-p", "1024", "--host", "nas",
                                 "--remote-path", "/srv/b", "--staging-dir", "/scratch",
                                 "--log-file", "/tmp/x.log", "--accept-new-host-keys"});

    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.compress);
    EXPECT_TRUE(config.archiveOnly);
    EXPECT_FALSE(config.transferOnly);
    EXPECT_EQ(config.sourcePath, "/data");
    EXPECT_EQ(config.chunkSize, 1024u);
    EXPECT_EQ(config.host, "nas");
    EXPECT_EQ(config.remoteDir, "/srv/b");
    EXPECT_EQ(config.stagingDir, "/scratch");
    EXPECT_EQ(config.logFile, "/tmp/x.log");
    EXPECT_EQ(config.hostKeyPolicy, HostKeyPolicy::AcceptNew);
}

TEST_F(BackupCLITest, DefaultsWithoutFlags) {
    BackupConfig config = parse({});
    EXPECT_EQ(config.sourcePath, "~");
    EXPECT_EQ(config.chunkSize, kDefaultChunkSize);
    EXPECT_EQ(config.mode(), BackupMode::ArchiveAndTransfer);
}

TEST_F(BackupCLITest, HelpStopsParsing) {
    Args args{"--help"};
    BackupConfig config;
    EXPECT_FALSE(BackupCLI::parseArguments(args.argc(), args.argv(), config));
}

TEST_F(BackupCLITest, RejectsBadArguments) {
    BackupConfig config;
    Args unknown{"--frobnicate"};
    EXPECT_THROW(BackupCLI::parseArguments(unknown.argc(), unknown.argv(), config), ConfigurationError);

    Args missing{"--host"};
    EXPECT_THROW(BackupCLI::parseArguments(missing.argc(), missing.argv(), config), ConfigurationError);

    Args zero{"-p", "0"};
    EXPECT_THROW(BackupCLI::parseArguments(zero.argc(), zero.argv(), config), ConfigurationError);

    Args text{"-p", "6G"};
    EXPECT_THROW(BackupCLI::parseArguments(text.argc(), text.argv(), config), ConfigurationError);

    Args negative{"-p", "-5"};
    EXPECT_THROW(BackupCLI::parseArguments(negative.argc(), negative.argv(), config), ConfigurationError);
}

// Flags override the config file, which overrides the defaults
TEST_F(BackupCLITest, ConfigFilePrecedence) {
    writeFile(configHome_.file("chunkferry/config.json"), R"({"host": "from-file", "gzip": true})");

    BackupConfig fromFile = parse({});
    EXPECT_EQ(fromFile.host, "from-file");
    EXPECT_TRUE(fromFile.compress);

    BackupConfig overridden = parse({"--host", "from-flag"});
    EXPECT_EQ(overridden.host, "from-flag");
    EXPECT_TRUE(overridden.compress);
}

TEST_F(BackupCLITest, ExplicitConfigFileMustExist) {
    writeFile(configHome_.file("other.json"), R"({"remotePath": "/elsewhere"})");

    BackupConfig config = parse({"--config", configHome_.file("other.json")});
    EXPECT_EQ(config.remoteDir, "/elsewhere");

    Args missing{"--config", configHome_.file("absent.json")};
    BackupConfig unused;
    EXPECT_THROW(BackupCLI::parseArguments(missing.argc(), missing.argv(), unused), ConfigurationError);
}

TEST_F(BackupCLITest, ConfirmAnswers) {
    struct Case { const char* input; bool expected; };
    const Case cases[] = {{"\n", true}, {"y\n", true}, {"YES\n", true}, {"  Y \n", true},
                          {"n\n", false}, {"no\n", false}, {"", false}};

    for (const auto& c : cases) {
        std::istringstream in(c.input);
        std::ostringstream out;
        std::ostringstream err;
        BackupCLI cli(in, out, err);
        EXPECT_EQ(cli.confirm(), c.expected) << "input: '" << c.input << "'";
    }
}

TEST_F(BackupCLITest, ConfirmRepromptsOnInvalidInput) {
    std::istringstream in("maybe\nsure\ny\n");
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli(in, out, err);

    EXPECT_TRUE(cli.confirm());
    std::string text = out.str();
    size_t first = text.find("Invalid input");
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(text.find("Invalid input", first + 1), std::string::npos);
}

TEST_F(BackupCLITest, SummaryDescribesMode) {
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli(in, out, err);

    BackupConfig transfer;
    transfer.transferOnly = true;
    transfer.host = "nas";
    cli.printSummary(transfer);
    EXPECT_NE(out.str().find("Transfer existing backup files from /home/tmp/ to nas"), std::string::npos);
    EXPECT_NE(out.str().find("Using custom host: nas"), std::string::npos);
    EXPECT_EQ(out.str().find("Compress the directory"), std::string::npos);

    out.str("");
    BackupConfig archive;
    archive.archiveOnly = true;
    archive.compress = true;
    archive.chunkSize = 1000;
    cli.printSummary(archive);
    EXPECT_NE(out.str().find("Compress the directory: ~"), std::string::npos);
    EXPECT_NE(out.str().find("Using gzip compression"), std::string::npos);
    EXPECT_NE(out.str().find("Using custom part size: 1000 bytes"), std::string::npos);
    EXPECT_EQ(out.str().find("Transfer"), std::string::npos);
}

TEST_F(BackupCLITest, ConflictingModesExitWithUsageError) {
    Args args{"-t", "-c"};
    std::istringstream in("y\n");
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli(in, out, err);

    EXPECT_EQ(cli.run(args.argc(), args.argv()), 2);
    EXPECT_NE(err.str().find("Cannot use both"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(BackupCLITest, HelpExitsCleanly) {
    Args args{"-h"};
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli(in, out, err);

    EXPECT_EQ(cli.run(args.argc(), args.argv()), 0);
    EXPECT_NE(out.str().find("Usage: chunkferry"), std::string::npos);
}

TEST_F(BackupCLITest, DecliningCancelsWithoutWork) {
    TempDir work;
    Args args{"-t", "--staging-dir", work.path(), "--log-file", work.file("audit.log")};
    std::istringstream in("n\n");
    std::ostringstream out;
    std::ostringstream err;
    BackupCLI cli(in, out, err);

    EXPECT_EQ(cli.run(args.argc(), args.argv()), 0);
    EXPECT_NE(out.str().find("Operation cancelled by user."), std::string::npos);

    Logger::shutdown();
    EXPECT_NE(readFile(work.file("audit.log")).find("Operation cancelled by user"), std::string::npos);
}

// Runs the real front end against in-process fakes
class FakeWiredCLI : public BackupCLI {
public:
    using BackupCLI::BackupCLI;

    std::shared_ptr<FakeStreamArchiver> archiver = std::make_shared<FakeStreamArchiver>(std::string(450, 'x'));
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();

protected:
    std::unique_ptr<BackupJob> createJob(const BackupConfig& config) override {
        return std::make_unique<BackupJob>(config, archiver, transport, std::make_shared<RecordingProgressSink>());
    }
};

class BackupCLIRunTest : public BackupCLITest {
protected:
    void SetUp() override {
        BackupCLITest::SetUp();
        writeFile(work_.file("src/photo.jpg"), "pixels");
        std::filesystem::create_directory(work_.file("staging"));
    }

    int runWith(FakeWiredCLI& cli, const std::string& stagingDir) {
        Args args{"-s", work_.file("src"), "--staging-dir", stagingDir, "-p", "100",
                  "--host", "nas", "--log-file", logPath()};
        return cli.run(args.argc(), args.argv());
    }

    std::string logPath() const { return work_.file("audit.log"); }

    std::string auditLog() {
        Logger::shutdown();
        return readFile(logPath());
    }

    TempDir work_;
    std::istringstream in_{"y\n"};
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(BackupCLIRunTest, SuccessfulRunExitsZero) {
    FakeWiredCLI cli(in_, out_, err_);

    EXPECT_EQ(runWith(cli, work_.file("staging")), 0);
    EXPECT_EQ(cli.transport->uploaded.size(), 5u);
    EXPECT_NE(out_.str().find("Transferred 5 of 5 file(s) to nas"), std::string::npos);
    EXPECT_TRUE(err_.str().empty());
    EXPECT_TRUE(listFileNames(work_.file("staging")).empty());
}

TEST_F(BackupCLIRunTest, FailedChunkExitsOneAndIsAudited) {
    FakeWiredCLI cli(in_, out_, err_);
    cli.transport->failingAttempts = {3};

    EXPECT_EQ(runWith(cli, work_.file("staging")), 1);
    EXPECT_NE(out_.str().find("Transferred 4 of 5 file(s) to nas"), std::string::npos);
    EXPECT_NE(out_.str().find("Failed files were kept. Check " + logPath()), std::string::npos);
    EXPECT_EQ(listFileNames(work_.file("staging")).size(), 1u);

    std::string log = auditLog();
    EXPECT_NE(log.find("[INFO] Starting transfer of"), std::string::npos);
    EXPECT_NE(log.find("[INFO] Transfer of"), std::string::npos);
    EXPECT_NE(log.find("[INFO] Temporary file removed: "), std::string::npos);
    EXPECT_NE(log.find("[ERROR] Transfer of"), std::string::npos);
    EXPECT_NE(log.find("File not removed. Cause: remote path not writable"), std::string::npos);
}

TEST_F(BackupCLIRunTest, CompressionFailureShowsOnlyLogPointer) {
    FakeWiredCLI cli(in_, out_, err_);
    cli.archiver->failWith("tar: ./secret: Cannot open: Permission denied", 2);

    EXPECT_EQ(runWith(cli, work_.file("staging")), 1);
    EXPECT_EQ(err_.str(), "An error occurred. Check " + logPath() + " for details.\n");
    EXPECT_EQ(out_.str().find("Permission denied"), std::string::npos);
    EXPECT_TRUE(cli.transport->attempted.empty());

    // The diagnostics go to the audit log instead
    EXPECT_NE(auditLog().find("Permission denied"), std::string::npos);
}

TEST_F(BackupCLIRunTest, EnvironmentFailureShowsOnlyLogPointer) {
    FakeWiredCLI cli(in_, out_, err_);

    EXPECT_EQ(runWith(cli, work_.file("missing")), 1);
    EXPECT_EQ(err_.str(), "An error occurred. Check " + logPath() + " for details.\n");
    EXPECT_EQ(cli.archiver->calls, 0);
    EXPECT_NE(auditLog().find("does not exist"), std::string::npos);
}
