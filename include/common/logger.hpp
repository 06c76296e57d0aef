#pragma once

#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Audit log. Every message goes to the log file; the console only sees
// messages when console output is enabled (verbose runs).
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setConsoleOutput(bool enabled);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized() { return initialized_; }
    static std::string getLogPath();

private:
    static void log(LogLevel level, const std::string& message);
    static std::string levelToString(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool consoleOutput_;
    static std::string logPath_;
};
