#include "main/sync_main.hpp"
#include "common/logger.hpp"
#include "sync/sync_error.hpp"
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::string configPath;
    bool verbose = false;
    std::vector<char*> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printSyncUsage();
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "datasync version 1.0.0\n";
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a file" << std::endl;
                return 1;
            }
            configPath = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            args.push_back(argv[i]);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        printSyncUsage();
        return 1;
    }

    // Writes to a tool whose pipe closed must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        SyncConfig config;
        if (!configPath.empty()) {
            config = loadSyncConfig(configPath);
        }

        LogLevel level = LogLevel::INFO;
        if (!Logger::parseLevel(config.logLevel, level)) {
            std::cerr << "Error: unknown log level " << config.logLevel << std::endl;
            return 1;
        }
        if (!Logger::initialize(config.logPath, level)) {
            std::cerr << "Failed to initialize logger" << std::endl;
            return 1;
        }
        Logger::setConsoleOutput(verbose);

        std::string command = args[0];
        int commandArgc = static_cast<int>(args.size());
        if (command == "run") {
            return runMain(commandArgc, args.data(), config);
        } else if (command == "verify") {
            return verifyMain(commandArgc, args.data(), config);
        } else if (command == "strategies") {
            return strategiesMain(config);
        }

        std::cerr << "Error: Unknown command: " << command << std::endl;
        Logger::error("Unknown command: " + command);
        printSyncUsage();
        return 1;
    } catch (const SyncError& e) {
        std::cerr << "Error (" << SyncError::categoryToString(e.getCategory()) << "): " << e.what() << std::endl;
        Logger::error(std::string("Error in main: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        return 1;
    }
}
