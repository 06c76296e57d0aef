#include "backup/stream_archiver.hpp"
#include "common/backup_errors.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

static std::string readFile(const std::string& path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

static std::string createStderrCapture() {
    std::string pattern = (std::filesystem::temp_directory_path() / "chunkferry-tar-XXXXXX").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemp(name.data());
    if (fd < 0) {
        throw CompressionError("Failed to create stderr capture file", std::strerror(errno));
    }
    close(fd);
    return std::string(name.data());
}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

TarStreamArchiver::TarStreamArchiver(bool gzip, const std::string& tarCommand)
    : gzip_(gzip)
    , tarCommand_(tarCommand) {
}

std::string TarStreamArchiver::describe() const {
    return gzip_ ? "tar (gzip)" : "tar";
}

std::string TarStreamArchiver::buildCommand(const std::string& sourceDir, const std::string& stderrPath) const {
    return tarCommand_ + (gzip_ ? " -czf" : " -cf") + " - -C " + shellQuote(sourceDir) +
           " . 2>" + shellQuote(stderrPath);
}

void TarStreamArchiver::writeArchive(const std::string& sourceDir, const StreamSink& sink) {
    std::string stderrPath = createStderrCapture();
    std::string cmd = buildCommand(sourceDir, stderrPath);
    Logger::info("Executing command: " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        int err = errno;
        unlink(stderrPath.c_str());
        throw CompressionError("Failed to start archiver", std::strerror(err));
    }

    std::vector<char> buffer(1 << 20);
    try {
        size_t n;
        while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
            sink(buffer.data(), n);
        }
        if (ferror(pipe)) {
            throw CompressionError("Failed to read archiver output", std::strerror(errno));
        }
    } catch (...) {
        pclose(pipe);
        unlink(stderrPath.c_str());
        throw;
    }

    int status = pclose(pipe);
    std::string diagnostics = readFile(stderrPath);
    unlink(stderrPath.c_str());

    if (status == -1) {
        throw CompressionError("Failed to wait for archiver", std::strerror(errno));
    }
    if (!WIFEXITED(status)) {
        int signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
        throw CompressionError("Archiver terminated by signal " + std::to_string(signal), diagnostics);
    }
    int exitCode = WEXITSTATUS(status);
    if (exitCode != 0) {
        throw CompressionError("Compression failed with return code " + std::to_string(exitCode),
                               diagnostics, exitCode);
    }
    if (!diagnostics.empty()) {
        Logger::warning("Archiver reported: " + diagnostics);
    }
}
