#pragma once

#include <stdexcept>
#include <string>

// Base class for every error a backup run can raise.
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid or conflicting options. Raised before any side effect.
class ConfigurationError : public BackupError {
public:
    explicit ConfigurationError(const std::string& message) : BackupError(message) {}
};

// Staging directory or source directory unusable.
class EnvironmentError : public BackupError {
public:
    explicit EnvironmentError(const std::string& message) : BackupError(message) {}
};

// The archiving tool failed. Carries its captured stderr.
class CompressionError : public BackupError {
public:
    CompressionError(const std::string& message, const std::string& diagnostics, int exitStatus = -1)
        : BackupError(message)
        , diagnostics_(diagnostics)
        , exitStatus_(exitStatus) {}

    const std::string& diagnostics() const { return diagnostics_; }
    int exitStatus() const { return exitStatus_; }

private:
    std::string diagnostics_;
    int exitStatus_;
};

// Failure of a single file upload. Never leaves the transport.
class TransferError : public BackupError {
public:
    explicit TransferError(const std::string& message) : BackupError(message) {}
};
