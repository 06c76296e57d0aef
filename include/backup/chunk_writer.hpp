#pragma once

#include "backup/chunk.hpp"
#include "common/checksum.hpp"
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// Splits a byte stream into consecutive files <basePath>.<suffix> of exactly
// chunkSize bytes, except the last one which holds the remainder.
class ChunkWriter {
public:
    ChunkWriter(const std::string& basePath, uint64_t chunkSize);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    // Throws EnvironmentError on I/O failure.
    void write(const char* data, size_t length);

    // Closes the open chunk and returns every chunk written, in order.
    std::vector<Chunk> finish();

    uint64_t bytesWritten() const { return totalBytes_; }

private:
    void openNextChunk();
    void closeCurrentChunk();

    std::string basePath_;
    uint64_t chunkSize_;
    std::ofstream out_;
    Sha256Digest digest_;
    Chunk current_;
    bool open_{false};
    uint64_t totalBytes_{0};
    std::vector<Chunk> chunks_;
};
