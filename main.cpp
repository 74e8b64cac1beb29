/**
 * @file main.cpp
 * @brief ccota - OTA firmware container tool, main entry point
 *
 * Usage:
 *   ccota [--config <file>] encode <input.swu|input.zip> <output.bin> [major] [minor] [patch] [board_type]
 *   ccota [--config <file>] decode <firmware.bin> <output.zip> [--trim]
 *   ccota [--config <file>] info   <firmware.bin>
 *
 * @version 1.0
 */

#include <iostream>
#include <string>
#include <vector>
#include "cli_args.hpp"
#include "config_manager.hpp"
#include "firmware_tool.hpp"

static void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " [--config <file>] encode <input.swu|input.zip> <output.bin>"
              << " [major] [minor] [patch] [board_type]\n"
              << "  " << program << " [--config <file>] decode <firmware.bin> <output.zip> [--trim]\n"
              << "  " << program << " [--config <file>] info <firmware.bin>\n"
              << "\n"
              << "  major / minor / patch  - firmware version digits (default: 0)\n"
              << "  board_type             - 0 = e100_lite / e100 (default: 0)\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " encode update/update.swu update.bin 1 1 46\n"
              << "  " << program << " encode firmware.zip update.bin 1 1 46 0\n"
              << "  " << program << " decode update.bin update.zip\n";
}

int main(int argc, char* argv[]) {
    // Parse arguments
    std::string config_file;
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            config_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // Load config
    ConfigManager config(config_file);
    if (!config.load()) {
        std::cerr << "[ERROR] Failed to load config\n";
        return 1;
    }

    FirmwareTool tool(config);
    if (!tool.initialize()) {
        std::cerr << "[ERROR] Initialization failed\n";
        return 1;
    }

    const std::string& command = args[0];
    bool ok = false;

    if (command == "encode") {
        if (args.size() < 3 || args.size() > 7) {
            printUsage(argv[0]);
            return 2;
        }

        FirmwareVersion version = config.getDefaultVersion();
        unsigned int* fields[] = {&version.major, &version.minor, &version.patch, &version.board_type};
        for (size_t i = 3; i < args.size(); i++) {
            if (!parseVersionNumber(args[i], *fields[i - 3])) {
                std::cerr << "[ERROR] Not a number: " << args[i] << "\n";
                printUsage(argv[0]);
                return 2;
            }
        }

        ok = tool.encode(args[1], args[2], version);
    } else if (command == "decode") {
        bool trim = config.trimPadding();
        std::vector<std::string> paths;
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i] == "--trim") {
                trim = true;
            } else {
                paths.push_back(args[i]);
            }
        }
        if (paths.size() != 2) {
            printUsage(argv[0]);
            return 2;
        }

        ok = tool.decode(paths[0], paths[1], trim);
    } else if (command == "info") {
        if (args.size() != 2) {
            printUsage(argv[0]);
            return 2;
        }

        ok = tool.info(args[1]);
    } else {
        std::cerr << "[ERROR] Unknown command: " << command << "\n";
        printUsage(argv[0]);
        return 2;
    }

    return ok ? 0 : 1;
}
