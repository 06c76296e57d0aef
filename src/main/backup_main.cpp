#include "main/backup_main.hpp"
#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>

void printBackupUsage(std::ostream& out) {
    out << "Usage: chunkferry [options]\n"
        << "Archive a directory, split it into parts and upload the parts over SFTP.\n"
        << "\n"
        << "Options:\n"
        << "  -h, --help               Show this help message\n"
        << "  -v, --verbose            Print detailed output\n"
        << "  -t, --transfer-only      Transfer existing parts without compression\n"
        << "  -z, --gzip               Compress the archive with gzip\n"
        << "  -c, --compress-only      Compress without transferring\n"
        << "  -s, --source DIR         Source directory to back up (default: home directory)\n"
        << "  -p, --part-size BYTES    Part size in bytes (default: 6 GiB)\n"
        << "  --host HOST              Host or ssh config alias to send the parts to (default: home_server)\n"
        << "  --remote-path DIR        Absolute remote directory (default: /home/llucsm/backups/)\n"
        << "  --staging-dir DIR        Local directory for parts (default: /home/tmp/)\n"
        << "  --config FILE            JSON config file\n"
        << "  --log-file FILE          Audit log file (default: backup.log)\n"
        << "  --accept-new-host-keys   Trust and record unknown host keys\n"
        << "  --remove-transferred     Delete parts after upload in transfer-only mode\n";
}

int backupMain(int argc, char* argv[]) {
    BackupCLI cli(std::cin, std::cout, std::cerr);
    int status = cli.run(argc, argv);
    Logger::shutdown();
    return status;
}
