#include "backup/backup_job.hpp"
#include "backup/archiver.hpp"
#include "backup/space_guard.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

size_t JobReport::failedCount() const {
    size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (!outcome.transferred) {
            failed++;
        }
    }
    return failed;
}

static std::string joinPaths(const std::vector<Chunk>& chunks) {
    std::string joined;
    for (const auto& chunk : chunks) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += chunk.path;
    }
    return joined;
}

BackupJob::BackupJob(const BackupConfig& config,
                     std::shared_ptr<StreamArchiver> archiver,
                     std::shared_ptr<FileTransport> transport,
                     std::shared_ptr<ProgressSink> progress)
    : config_(config)
    , archiver_(archiver)
    , transport_(transport)
    , progress_(progress) {
}

void BackupJob::checkDependencies(BackupMode mode) const {
    if (mode != BackupMode::TransferOnly && !archiver_) {
        throw ConfigurationError("No stream archiver configured");
    }
    if (mode != BackupMode::ArchiveOnly && (!transport_ || !progress_)) {
        throw ConfigurationError("No transport configured");
    }
}

JobReport BackupJob::run() {
    JobReport report;
    Logger::info("Backup job " + getId() + " starting");

    try {
        report.mode = config_.mode();
        config_.validate();
        checkDependencies(report.mode);
        Logger::info("Running in " + std::string(modeToString(report.mode)) + " mode");

        if (report.mode == BackupMode::TransferOnly) {
            report.chunks = collectExisting();
        } else {
            report.chunks = archiveSource();
        }
    } catch (const BackupError& e) {
        Logger::error("Backup job " + getId() + " failed in state " + stateToString(getState()) + ": " + e.what());
        setError(e.what());
        setState(State::Failed);
        report.success = false;
        throw;
    }

    if (report.chunks.empty()) {
        Logger::warning("Nothing to transfer, backup job " + getId() + " finished without changes");
        report.noop = true;
        setState(State::Done);
        return report;
    }

    Logger::info("Files to transfer: " + joinPaths(report.chunks));

    if (report.mode == BackupMode::ArchiveOnly) {
        Logger::info("Compression completed. Files not transferred due to --compress-only option.");
        setState(State::Done);
        return report;
    }

    bool removeAfterTransfer = report.mode != BackupMode::TransferOnly || config_.removeTransferred;
    setState(State::Transferring);
    transferChunks(report.chunks, removeAfterTransfer, report);

    size_t failed = report.failedCount();
    report.success = failed == 0;
    if (report.success) {
        Logger::info("Backup job " + getId() + " completed: " + std::to_string(report.outcomes.size()) +
                     " file(s) transferred");
    } else {
        setError(std::to_string(failed) + " of " + std::to_string(report.outcomes.size()) +
                 " file(s) failed to transfer");
        Logger::error("Backup job " + getId() + " finished with errors: " + getError());
    }
    setState(State::Done);
    return report;
}

std::vector<Chunk> BackupJob::collectExisting() {
    setState(State::CollectingExisting);
    std::vector<Chunk> chunks = discoverChunks(config_.stagingDir);
    if (chunks.empty()) {
        Logger::warning("No files found for transfer in " + config_.stagingDir);
    }
    return chunks;
}

std::vector<Chunk> BackupJob::archiveSource() {
    setState(State::ValidatingEnvironment);
    Logger::info("Validating staging directory " + config_.stagingDir);
    SpaceGuard::check(config_.stagingDir, config_.chunkSize);

    setState(State::Archiving);
    std::string source = expandUser(config_.sourcePath);
    Logger::info("Starting compression of " + source);
    Archiver archiver(archiver_);
    return archiver.archive(source, config_.stagingDir, config_.chunkSize);
}

void BackupJob::transferChunks(const std::vector<Chunk>& chunks, bool removeAfterTransfer, JobReport& report) {
    std::string remoteDir = config_.effectiveRemoteDir();
    TransferResult session = transport_->openSession(config_.host);
    if (!session.success) {
        Logger::error("Cannot open session to " + config_.host + ": " + session.errorMessage);
    }

    for (const auto& chunk : chunks) {
        ChunkOutcome outcome;
        outcome.chunk = chunk;

        Logger::info("Starting transfer of " + chunk.path + " to " + config_.host + ":" + remoteDir);
        TransferResult result = session.success ? transport_->putFile(chunk.path, remoteDir, *progress_) : session;

        if (result.success) {
            outcome.transferred = true;
            Logger::info("Transfer of " + chunk.path + " completed (" + std::to_string(result.bytesTransferred) +
                         " bytes to " + result.remotePath + ")");
            if (removeAfterTransfer) {
                std::error_code ec;
                if (std::filesystem::remove(chunk.path, ec)) {
                    outcome.removed = true;
                    Logger::info("Temporary file removed: " + chunk.path);
                } else {
                    Logger::warning("Failed to remove " + chunk.path + ": " + ec.message());
                }
            }
        } else {
            outcome.error = result.errorMessage;
            Logger::error("Transfer of " + chunk.path + " failed. File not removed. Cause: " + result.errorMessage);
        }
        report.outcomes.push_back(outcome);
    }

    transport_->closeSession();
}
