#include "backup/chunk_writer.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>

ChunkWriter::ChunkWriter(const std::string& basePath, uint64_t chunkSize)
    : basePath_(basePath)
    , chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw ConfigurationError("Chunk size must be positive");
    }
}

ChunkWriter::~ChunkWriter() {
    if (open_) {
        out_.close();
    }
}

void ChunkWriter::write(const char* data, size_t length) {
    while (length > 0) {
        if (!open_) {
            openNextChunk();
        }

        uint64_t room = chunkSize_ - current_.size;
        size_t n = static_cast<size_t>(std::min<uint64_t>(room, length));
        out_.write(data, static_cast<std::streamsize>(n));
        if (!out_) {
            throw EnvironmentError("Failed to write " + current_.path + ": " + std::strerror(errno));
        }
        digest_.update(data, n);
        current_.size += n;
        totalBytes_ += n;
        data += n;
        length -= n;

        if (current_.size == chunkSize_) {
            closeCurrentChunk();
        }
    }
}

std::vector<Chunk> ChunkWriter::finish() {
    if (open_) {
        closeCurrentChunk();
    }
    return chunks_;
}

void ChunkWriter::openNextChunk() {
    current_ = Chunk();
    current_.suffix = chunkSuffix(chunks_.size());
    current_.path = basePath_ + "." + current_.suffix;

    out_.open(current_.path, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw EnvironmentError("Failed to create chunk " + current_.path + ": " + std::strerror(errno));
    }
    open_ = true;
}

void ChunkWriter::closeCurrentChunk() {
    out_.close();
    open_ = false;
    if (out_.fail()) {
        throw EnvironmentError("Failed to close chunk " + current_.path);
    }

    current_.sha256 = digest_.finalizeHex();
    Logger::info("Created chunk " + current_.path + " (" + std::to_string(current_.size) +
                 " bytes, sha256 " + current_.sha256 + ")");
    chunks_.push_back(current_);
}
