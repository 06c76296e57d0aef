#pragma once

#include "common/job.hpp"
#include "common/progress_sink.hpp"
#include "backup/backup_config.hpp"
#include "backup/chunk.hpp"
#include "backup/stream_archiver.hpp"
#include "transport/file_transport.hpp"
#include <memory>
#include <string>
#include <vector>

struct ChunkOutcome {
    Chunk chunk;
    bool transferred = false;
    bool removed = false;
    std::string error;
};

struct JobReport {
    BackupMode mode = BackupMode::ArchiveAndTransfer;
    std::vector<Chunk> chunks;           // chunks produced or discovered
    std::vector<ChunkOutcome> outcomes;  // one per transfer attempt
    bool success = true;
    bool noop = false;  // nothing to archive or nothing to transfer

    size_t failedCount() const;
};

// Runs one backup: validate, archive, transfer, clean up.
class BackupJob : public Job {
public:
    BackupJob(const BackupConfig& config,
              std::shared_ptr<StreamArchiver> archiver,
              std::shared_ptr<FileTransport> transport,
              std::shared_ptr<ProgressSink> progress);

    // Fatal errors (ConfigurationError, EnvironmentError, CompressionError)
    // are logged and rethrown. Transfer failures are reported, not thrown.
    JobReport run();

private:
    std::vector<Chunk> collectExisting();
    std::vector<Chunk> archiveSource();
    void transferChunks(const std::vector<Chunk>& chunks, bool removeAfterTransfer, JobReport& report);
    void checkDependencies(BackupMode mode) const;

    BackupConfig config_;
    std::shared_ptr<StreamArchiver> archiver_;
    std::shared_ptr<FileTransport> transport_;
    std::shared_ptr<ProgressSink> progress_;
};
