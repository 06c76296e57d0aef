#include "backup/archiver.hpp"
#include "backup/chunk_writer.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <stdexcept>
#include <filesystem>
#include <system_error>
#include <unistd.h>

Archiver::Archiver(std::shared_ptr<StreamArchiver> streamArchiver)
    : streamArchiver_(streamArchiver) {
    if (!streamArchiver_) {
        throw std::invalid_argument("Archiver requires a stream archiver");
    }
}

uint64_t Archiver::estimateSourceSize(const std::string& sourceDir) {
    uint64_t total = 0;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        sourceDir, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::warning("Cannot walk " + sourceDir + ": " + ec.message());
        return 0;
    }

    for (auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            Logger::warning("Error while walking " + sourceDir + ": " + ec.message());
            break;
        }
        std::error_code entryEc;
        if (it->is_symlink(entryEc)) {
            continue;
        }
        if (it->is_regular_file(entryEc)) {
            uint64_t size = it->file_size(entryEc);
            if (!entryEc) {
                total += size;
            }
        }
    }
    return total;
}

uint64_t Archiver::expectedChunkCount(uint64_t estimate, uint64_t chunkSize) {
    if (chunkSize == 0) {
        return 0;
    }
    return (estimate + chunkSize - 1) / chunkSize;
}

void Archiver::validateSource(const std::string& sourceDir) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(sourceDir, ec)) {
        throw EnvironmentError("Source directory does not exist: " + sourceDir);
    }
    if (access(sourceDir.c_str(), R_OK | X_OK) != 0) {
        throw EnvironmentError("Source directory is not readable: " + sourceDir);
    }
}

std::vector<Chunk> Archiver::archive(const std::string& sourceDir, const std::string& stagingDir, uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw ConfigurationError("Part size must be a positive number of bytes");
    }
    validateSource(sourceDir);

    std::error_code ec;
    if (std::filesystem::directory_iterator(sourceDir, ec) == std::filesystem::directory_iterator()) {
        Logger::warning("Source directory " + sourceDir + " is empty, no output files were created");
        return {};
    }

    uint64_t estimate = estimateSourceSize(sourceDir);
    Logger::info("Source " + sourceDir + " holds about " + std::to_string(estimate) +
                 " bytes, expecting about " + std::to_string(expectedChunkCount(estimate, chunkSize)) + " chunk(s)");

    std::string baseName = chunkBaseName(sourceDir, streamArchiver_->isCompressed(),
                                         std::chrono::system_clock::now());
    std::string basePath = (std::filesystem::path(stagingDir) / baseName).string();

    Logger::info("Archiving " + sourceDir + " with " + streamArchiver_->describe() +
                 " into " + basePath + ".* (part size " + std::to_string(chunkSize) + ")");

    ChunkWriter writer(basePath, chunkSize);
    try {
        streamArchiver_->writeArchive(sourceDir, [&writer](const char* data, size_t length) {
            writer.write(data, length);
        });
    } catch (const CompressionError& e) {
        Logger::error(std::string(e.what()) + " while archiving " + sourceDir);
        Logger::error("stderr: " + e.diagnostics());
        throw;
    }

    std::vector<Chunk> chunks = writer.finish();
    if (chunks.empty()) {
        Logger::warning("No output files were created");
        return chunks;
    }

    Logger::info("Compression completed successfully: " + std::to_string(chunks.size()) +
                 " chunk(s), " + std::to_string(writer.bytesWritten()) + " bytes");
    return chunks;
}
