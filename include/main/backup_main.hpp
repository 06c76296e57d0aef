#pragma once

#include <ostream>

// Print the command usage information
void printBackupUsage(std::ostream& out);

// Main entry point
int backupMain(int argc, char* argv[]);
