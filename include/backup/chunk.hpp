#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// One slice of an archive stream stored in the staging directory.
struct Chunk {
    std::string path;
    std::string suffix;
    uint64_t size = 0;
    std::string sha256;  // empty for chunks discovered on disk
};

// Suffix of the index-th chunk, following split(1): aa..yz, zaaa..zyzz,
// zzaaaa.. so that byte order of the names matches creation order.
std::string chunkSuffix(size_t index);

// backup_<basename>_<YYYYMMDD_HHMMSS>.<tar|tar.gz>, without directory.
std::string chunkBaseName(const std::string& sourceDir, bool compressed,
                          std::chrono::system_clock::time_point when);

// True if fileName follows the chunk naming convention.
bool isChunkFileName(const std::string& fileName);

// Regular files in stagingDir that follow the naming convention, sorted by name.
std::vector<Chunk> discoverChunks(const std::string& stagingDir);
