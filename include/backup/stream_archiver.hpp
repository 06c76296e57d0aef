#pragma once

#include <cstddef>
#include <functional>
#include <string>

using StreamSink = std::function<void(const char* data, size_t length)>;

// Produces a sequential archive of a directory tree.
class StreamArchiver {
public:
    virtual ~StreamArchiver() = default;

    // Feeds the archive of every entry under sourceDir to sink, in order.
    // Symbolic links are stored as links. Throws CompressionError if the
    // archive could not be produced.
    virtual void writeArchive(const std::string& sourceDir, const StreamSink& sink) = 0;

    virtual bool isCompressed() const = 0;
    virtual std::string describe() const = 0;
};

// Runs tar(1), optionally gzip-compressed, and reads the archive from its stdout.
class TarStreamArchiver : public StreamArchiver {
public:
    explicit TarStreamArchiver(bool gzip, const std::string& tarCommand = "tar");

    void writeArchive(const std::string& sourceDir, const StreamSink& sink) override;
    bool isCompressed() const override { return gzip_; }
    std::string describe() const override;

    std::string buildCommand(const std::string& sourceDir, const std::string& stderrPath) const;

private:
    bool gzip_;
    std::string tarCommand_;
};

// Quotes a string for /bin/sh.
std::string shellQuote(const std::string& value);
