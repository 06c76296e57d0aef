#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>

class BackupCLI {
public:
    BackupCLI(std::istream& in, std::ostream& out, std::ostream& err);
    virtual ~BackupCLI() = default;

    // Returns the process exit status: 0 success, no-op or cancelled,
    // 1 job failure, 2 usage or configuration error.
    int run(int argc, char* argv[]);

    // Fills config from the config file and the flags. Returns false when
    // help was requested. Throws ConfigurationError on bad input.
    static bool parseArguments(int argc, char* argv[], BackupConfig& config);

    void printSummary(const BackupConfig& config) const;
    bool confirm() const;
    void printReport(const JobReport& report, const BackupConfig& config) const;

protected:
    virtual std::unique_ptr<BackupJob> createJob(const BackupConfig& config);

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};
