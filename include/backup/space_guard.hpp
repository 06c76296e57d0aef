#pragma once

#include <cstdint>
#include <string>

// Precondition check for the staging directory. No side effects.
class SpaceGuard {
public:
    // Throws EnvironmentError if stagingDir is missing, not writable,
    // or has less than requiredBytes available.
    static void check(const std::string& stagingDir, uint64_t requiredBytes);

    // Available bytes on the filesystem holding path.
    static uint64_t availableBytes(const std::string& path);
};
