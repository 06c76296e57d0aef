#include "backup/backup_cli.hpp"
#include "backup/stream_archiver.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include "common/progress_sink.hpp"
#include "main/backup_main.hpp"
#include "transport/sftp_transport.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

static std::string requireValue(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw ConfigurationError("Option " + flag + " requires a value");
    }
    return argv[++i];
}

static uint64_t parsePartSize(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigurationError("Part size must be a positive integer: " + value);
    }
    try {
        uint64_t size = std::stoull(value);
        if (size == 0) {
            throw ConfigurationError("Part size must be a positive integer: " + value);
        }
        return size;
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Part size out of range: " + value);
    }
}

BackupCLI::BackupCLI(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in)
    , out_(out)
    , err_(err) {
}

bool BackupCLI::parseArguments(int argc, char* argv[], BackupConfig& config) {
    // The config file sits below the flags, so load it first
    std::string configPath;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            configPath = requireValue(argc, argv, i, arg);
        }
    }
    if (configPath.empty()) {
        loadConfigFile(defaultConfigFilePath(), config, false);
    } else {
        loadConfigFile(expandUser(configPath), config, true);
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-t" || arg == "--transfer-only") {
            config.transferOnly = true;
        } else if (arg == "-z" || arg == "--gzip") {
            config.compress = true;
        } else if (arg == "-c" || arg == "--compress-only") {
            config.archiveOnly = true;
        } else if (arg == "-s" || arg == "--source") {
            config.sourcePath = requireValue(argc, argv, i, arg);
        } else if (arg == "-p" || arg == "--part-size") {
            config.chunkSize = parsePartSize(requireValue(argc, argv, i, arg));
        } else if (arg == "--host") {
            config.host = requireValue(argc, argv, i, arg);
        } else if (arg == "--remote-path") {
            config.remoteDir = requireValue(argc, argv, i, arg);
        } else if (arg == "--staging-dir") {
            config.stagingDir = requireValue(argc, argv, i, arg);
        } else if (arg == "--log-file") {
            config.logFile = requireValue(argc, argv, i, arg);
        } else if (arg == "--accept-new-host-keys") {
            config.hostKeyPolicy = HostKeyPolicy::AcceptNew;
        } else if (arg == "--remove-transferred") {
            config.removeTransferred = true;
        } else if (arg == "--config") {
            ++i;  // already applied
        } else {
            throw ConfigurationError("Unknown option: " + arg);
        }
    }
    return true;
}

void BackupCLI::printSummary(const BackupConfig& config) const {
    std::vector<std::string> summary = {"Summary of actions:"};

    BackupMode mode = config.mode();
    if (mode == BackupMode::TransferOnly) {
        summary.push_back("- Transfer existing backup files from " + config.stagingDir + " to " + config.host);
        if (config.removeTransferred) {
            summary.push_back("- Remove local files after successful transfer");
        }
    } else if (mode == BackupMode::ArchiveOnly) {
        summary.push_back("- Compress the directory: " + config.sourcePath);
        summary.push_back("- Files will be saved in " + config.stagingDir);
        if (config.compress) {
            summary.push_back("- Using gzip compression");
        }
    } else {
        summary.push_back("- Compress the directory: " + config.sourcePath);
        if (config.compress) {
            summary.push_back("- Using gzip compression");
        }
        summary.push_back("- Transfer compressed files to " + config.host);
        summary.push_back("- Remove temporary files after successful transfer");
    }

    if (config.verbose) {
        summary.push_back("- Verbose mode: Detailed output will be displayed");
    }
    if (config.chunkSize != kDefaultChunkSize) {
        summary.push_back("- Using custom part size: " + std::to_string(config.chunkSize) + " bytes");
    }
    if (config.host != kDefaultHost && mode != BackupMode::ArchiveOnly) {
        summary.push_back("- Using custom host: " + config.host);
    }
    if (!config.remoteDir.empty() && mode != BackupMode::ArchiveOnly) {
        summary.push_back("- Using custom remote path: " + config.remoteDir);
    }
    if (config.hostKeyPolicy == HostKeyPolicy::AcceptNew && mode != BackupMode::ArchiveOnly) {
        summary.push_back("- Unknown host keys will be trusted on first use");
    }

    for (const auto& line : summary) {
        out_ << line << "\n";
    }
    out_.flush();
}

bool BackupCLI::confirm() const {
    std::string response;
    while (true) {
        out_ << "Do you want to proceed? (Y/n): " << std::flush;
        if (!std::getline(in_, response)) {
            out_ << "\n";
            return false;
        }

        response.erase(0, response.find_first_not_of(" \t\r"));
        response.erase(response.find_last_not_of(" \t\r") + 1);
        std::transform(response.begin(), response.end(), response.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (response.empty() || response == "y" || response == "yes") {
            return true;
        } else if (response == "n" || response == "no") {
            return false;
        }
        out_ << "Invalid input. Please enter 'Y' or 'n'.\n";
    }
}

void BackupCLI::printReport(const JobReport& report, const BackupConfig& config) const {
    if (report.noop) {
        if (report.mode == BackupMode::TransferOnly) {
            out_ << "No files found for transfer in " << config.stagingDir << "\n";
        } else {
            out_ << "Source directory is empty, nothing to back up.\n";
        }
        return;
    }

    if (report.mode == BackupMode::ArchiveOnly) {
        out_ << "Compression completed. Files not transferred due to --compress-only option.\n";
        for (const auto& chunk : report.chunks) {
            out_ << "  " << chunk.path << "\n";
        }
        return;
    }

    size_t failed = report.failedCount();
    out_ << "Transferred " << (report.outcomes.size() - failed) << " of " << report.outcomes.size()
         << " file(s) to " << config.host << "\n";
    for (const auto& outcome : report.outcomes) {
        if (!outcome.transferred) {
            out_ << "  failed: " << outcome.chunk.path << "\n";
        }
    }
    if (failed > 0) {
        out_ << "Failed files were kept. Check " << Logger::getLogPath() << " for details.\n";
    }
}

std::unique_ptr<BackupJob> BackupCLI::createJob(const BackupConfig& config) {
    std::shared_ptr<StreamArchiver> archiver = std::make_shared<TarStreamArchiver>(config.compress);

    SftpOptions options;
    options.sshConfigFile = config.sshConfigFile.empty() ? "" : expandUser(config.sshConfigFile);
    options.knownHostsFile = config.knownHostsFile.empty() ? "" : expandUser(config.knownHostsFile);
    options.hostKeyPolicy = config.hostKeyPolicy;
    options.connectTimeoutSeconds = config.connectTimeoutSeconds;
    std::shared_ptr<FileTransport> transport = std::make_shared<SftpTransport>(options);

    std::shared_ptr<ProgressSink> progress;
    if (config.verbose) {
        progress = std::make_shared<ProgressLineSink>(out_);
    } else {
        progress = std::make_shared<ProgressBarSink>(out_);
    }

    return std::make_unique<BackupJob>(config, archiver, transport, progress);
}

int BackupCLI::run(int argc, char* argv[]) {
    BackupConfig config;
    try {
        if (!parseArguments(argc, argv, config)) {
            printBackupUsage(out_);
            return 0;
        }
        config.validate();
    } catch (const ConfigurationError& e) {
        err_ << "Error: " << e.what() << "\n";
        printBackupUsage(err_);
        return 2;
    }

    if (!Logger::isInitialized() &&
        !Logger::initialize(config.logFile, config.verbose ? LogLevel::DEBUG : LogLevel::INFO)) {
        err_ << "Error: cannot write log file " << config.logFile << "\n";
        return 1;
    }
    Logger::setConsoleOutput(config.verbose);

    printSummary(config);
    if (!confirm()) {
        Logger::info("Operation cancelled by user");
        out_ << "Operation cancelled by user.\n";
        return 0;
    }

    try {
        std::unique_ptr<BackupJob> job = createJob(config);
        JobReport report = job->run();
        printReport(report, config);
        return report.success ? 0 : 1;
    } catch (const BackupError& e) {
        err_ << "An error occurred. Check " << Logger::getLogPath() << " for details.\n";
        return dynamic_cast<const ConfigurationError*>(&e) ? 2 : 1;
    } catch (const std::exception& e) {
        Logger::fatal(std::string("Unexpected error: ") + e.what());
        err_ << "An error occurred. Check " << Logger::getLogPath() << " for details.\n";
        return 1;
    }
}
