#pragma once

#include "backup/chunk.hpp"
#include "backup/stream_archiver.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Turns a source directory into ordered chunk files in the staging directory.
class Archiver {
public:
    explicit Archiver(std::shared_ptr<StreamArchiver> streamArchiver);

    // Returns the chunks produced, in creation order. An empty source
    // directory yields an empty list and a warning.
    // Throws EnvironmentError, ConfigurationError or CompressionError.
    std::vector<Chunk> archive(const std::string& sourceDir, const std::string& stagingDir, uint64_t chunkSize);

    // Total size of regular files under sourceDir. Symbolic links are
    // neither followed nor counted.
    static uint64_t estimateSourceSize(const std::string& sourceDir);

    // Number of chunks a stream of estimate bytes splits into.
    static uint64_t expectedChunkCount(uint64_t estimate, uint64_t chunkSize);

private:
    void validateSource(const std::string& sourceDir) const;

    std::shared_ptr<StreamArchiver> streamArchiver_;
};
