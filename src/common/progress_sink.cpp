#include "common/progress_sink.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>

std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }

    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return ss.str();
}

ProgressBarSink::ProgressBarSink(std::ostream& out, int width)
    : out_(out)
    , width_(width) {
}

void ProgressBarSink::begin(const std::string& name, uint64_t totalBytes) {
    name_ = name;
    total_ = totalBytes;
    shown_ = 0;
    lastPercent_ = -1;
    draw();
}

void ProgressBarSink::update(uint64_t transferred, uint64_t totalBytes) {
    if (totalBytes != 0) {
        total_ = totalBytes;
    }
    // Only the increment since the last redraw advances the bar
    if (transferred <= shown_) {
        return;
    }
    shown_ = transferred;
    draw();
}

void ProgressBarSink::end(bool success) {
    if (success && shown_ < total_) {
        shown_ = total_;
        lastPercent_ = -1;
        draw();
    }
    out_ << (success ? "" : " failed") << "\n";
    out_.flush();
}

void ProgressBarSink::draw() {
    int percent = total_ == 0 ? 100 : static_cast<int>((shown_ * 100) / total_);
    if (percent == lastPercent_) {
        return;
    }
    lastPercent_ = percent;

    int filled = (percent * width_) / 100;
    out_ << "\rTransferring " << name_ << ": " << std::setw(3) << percent << "% ["
         << std::string(filled, '#') << std::string(width_ - filled, ' ') << "] "
         << formatBytes(shown_) << "/" << formatBytes(total_);
    out_.flush();
}

ProgressLineSink::ProgressLineSink(std::ostream& out) : out_(out) {
}

void ProgressLineSink::begin(const std::string& name, uint64_t totalBytes) {
    name_ = name;
    out_ << "Transferring " << name << " (" << totalBytes << " bytes)" << std::endl;
}

void ProgressLineSink::update(uint64_t transferred, uint64_t totalBytes) {
    out_ << "Transferred: " << transferred << "/" << totalBytes << std::endl;
}

void ProgressLineSink::end(bool success) {
    out_ << "Transfer of " << name_ << (success ? " completed" : " failed") << std::endl;
}
