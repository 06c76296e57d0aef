#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

// Receives upload progress for one file at a time.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void begin(const std::string& name, uint64_t totalBytes) = 0;
    // transferred is absolute and never decreases between begin() and end().
    virtual void update(uint64_t transferred, uint64_t totalBytes) = 0;
    virtual void end(bool success) = 0;
};

// Quiet mode: a single bar redrawn in place.
class ProgressBarSink : public ProgressSink {
public:
    explicit ProgressBarSink(std::ostream& out, int width = 30);

    void begin(const std::string& name, uint64_t totalBytes) override;
    void update(uint64_t transferred, uint64_t totalBytes) override;
    void end(bool success) override;

    uint64_t shown() const { return shown_; }

private:
    void draw();

    std::ostream& out_;
    int width_;
    std::string name_;
    uint64_t total_{0};
    uint64_t shown_{0};
    int lastPercent_{-1};
};

// Verbose mode: one line per update.
class ProgressLineSink : public ProgressSink {
public:
    explicit ProgressLineSink(std::ostream& out);

    void begin(const std::string& name, uint64_t totalBytes) override;
    void update(uint64_t transferred, uint64_t totalBytes) override;
    void end(bool success) override;

private:
    std::ostream& out_;
    std::string name_;
};

// Formats a byte count with a binary unit, e.g. "1.5 GiB".
std::string formatBytes(uint64_t bytes);
