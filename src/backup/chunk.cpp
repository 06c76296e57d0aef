#include "backup/chunk.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>
#include <system_error>

static const std::regex& chunkNamePattern() {
    static const std::regex pattern(R"(^backup_.+_[0-9]{8}_[0-9]{6}\.tar(\.gz)?\.([a-z]{2,})$)");
    return pattern;
}

std::string chunkSuffix(size_t index) {
    std::string prefix;
    size_t width = 2;
    for (;;) {
        // Suffixes of this width whose first letter is a..y
        size_t span = 25;
        for (size_t i = 1; i < width; ++i) {
            span *= 26;
        }
        if (index < span) {
            break;
        }
        index -= span;
        prefix += 'z';
        ++width;
    }

    std::string letters(width, 'a');
    for (size_t i = width; i-- > 0;) {
        letters[i] = static_cast<char>('a' + index % 26);
        index /= 26;
    }
    return prefix + letters;
}

std::string chunkBaseName(const std::string& sourceDir, bool compressed,
                          std::chrono::system_clock::time_point when) {
    std::filesystem::path source = std::filesystem::absolute(sourceDir).lexically_normal();
    std::string name = source.filename().string();
    if (name.empty()) {
        name = source.parent_path().filename().string();
    }
    if (name.empty()) {
        name = "root";
    }

    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream ss;
    ss << "backup_" << name << "_" << std::put_time(&local, "%Y%m%d_%H%M%S")
       << (compressed ? ".tar.gz" : ".tar");
    return ss.str();
}

bool isChunkFileName(const std::string& fileName) {
    // "<base>.tar.gz" is the 182nd part of a plain archive; unsplit archives
    // are never written to the staging directory.
    return std::regex_match(fileName, chunkNamePattern());
}

std::vector<Chunk> discoverChunks(const std::string& stagingDir) {
    std::vector<Chunk> chunks;
    std::error_code ec;
    std::filesystem::directory_iterator it(stagingDir, ec);
    if (ec) {
        Logger::error("Cannot list " + stagingDir + ": " + ec.message());
        return chunks;
    }

    for (const auto& entry : it) {
        std::error_code entryEc;
        if (!entry.is_regular_file(entryEc) || entry.is_symlink(entryEc)) {
            continue;
        }
        std::string fileName = entry.path().filename().string();
        if (!isChunkFileName(fileName)) {
            continue;
        }

        std::smatch match;
        std::regex_match(fileName, match, chunkNamePattern());

        Chunk chunk;
        chunk.path = entry.path().string();
        chunk.suffix = match[2];
        chunk.size = entry.file_size(entryEc);
        chunks.push_back(chunk);
    }

    std::sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) {
        return std::filesystem::path(a.path).filename().string() <
               std::filesystem::path(b.path).filename().string();
    });
    return chunks;
}
