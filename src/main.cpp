#include "winorg/core/Organizer.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>

using namespace worg;

// Global pointer for signal handling
Organizer* g_organizer = nullptr;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_organizer != nullptr) {
        g_organizer->stop();
    }
}

void printUsage(const char* program_name) {
    std::cout << "winorg - Window Organizer for EWMH window managers\n"
              << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version information\n"
              << "  -c, --config   Specify config file path\n"
              << "  -d, --display  Specify X display (e.g., :0, :1)\n"
              << "  --verbose      Log every dispatch\n"
              << std::endl;
}

void printVersion() {
    std::cout << "winorg v0.1.0\n"
              << "Built with C++20 for X11\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    Organizer::Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }

        if (arg == "-v" || arg == "--version") {
            printVersion();
            return 0;
        }

        if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                options.config_path = std::filesystem::path(argv[++i]);
            } else {
                std::cerr << "Error: --config requires a path argument" << std::endl;
                return 1;
            }
        } else if (arg == "-d" || arg == "--display") {
            if (i + 1 < argc) {
                options.display = argv[++i];
            } else {
                std::cerr << "Error: --display requires a display argument" << std::endl;
                return 1;
            }
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        Organizer organizer(options);
        g_organizer = &organizer;

        // Setup signal handlers
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!organizer.initialize()) {
            std::cerr << "Failed to initialize winorg" << std::endl;
            g_organizer = nullptr;
            return 1;
        }

        std::cout << "winorg running, Ctrl+C to exit" << std::endl;

        organizer.run();
        g_organizer = nullptr;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        g_organizer = nullptr;
        return 1;
    }

    return 0;
}
