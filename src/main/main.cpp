#include "main/backup_main.hpp"
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--version") {
        std::cout << "chunkferry version 1.0.0\n";
        return 0;
    }

    try {
        return backupMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        return 1;
    }
}
