#include "popswarm/app/PopupApp.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

using namespace pswarm;

// Global pointer for signal handling
PopupApp* g_app = nullptr;

void signalHandler(int signal) {
    if ((signal == SIGINT || signal == SIGTERM) && g_app) {
        g_app->requestQuit();
    }
}

void printUsage(const char* program_name) {
    std::cout << "Popswarm - Popup swarm for X11\n"
              << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  -h, --help        Show this help message\n"
              << "  -v, --version     Show version information\n"
              << "  -c, --config      Specify config file path\n"
              << "  -d, --display     Specify X display (e.g., :0, :1)\n"
              << "  -p, --pack        Media pack directory\n"
              << "  -n, --count       Number of popups to open at start (default 1)\n"
              << "  --interval MS     Open another popup every MS milliseconds (0 = never)\n"
              << "  --pump-scare      Close every popup shortly after it appears\n"
              << std::endl;
}

void printVersion() {
    std::cout << "Popswarm v0.1.0\n"
              << "Built with C++20 for X11\n"
              << std::endl;
}

static std::optional<int> parseCount(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int main(int argc, char* argv[]) {
    AppOptions options;
    options.pack_path = PopupApp::getDefaultPackPath();

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
                options.display_name = std::string(argv[++i]);
            } else {
                std::cerr << "Error: --display requires a display argument" << std::endl;
                return 1;
            }
        } else if (arg == "-p" || arg == "--pack") {
            if (i + 1 < argc) {
                options.pack_path = argv[++i];
            } else {
                std::cerr << "Error: --pack requires a directory argument" << std::endl;
                return 1;
            }
        } else if (arg == "-n" || arg == "--count") {
            auto count = i + 1 < argc ? parseCount(argv[++i]) : std::nullopt;
            if (!count) {
                std::cerr << "Error: --count requires a non-negative number" << std::endl;
                return 1;
            }
            options.initial_count = *count;
        } else if (arg == "--interval") {
            auto interval = i + 1 < argc ? parseCount(argv[++i]) : std::nullopt;
            if (!interval) {
                std::cerr << "Error: --interval requires a non-negative number of milliseconds" << std::endl;
                return 1;
            }
            options.spawn_interval = std::chrono::milliseconds(*interval);
        } else if (arg == "--pump-scare") {
            options.pump_scare = true;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        PopupApp app(std::move(options));
        g_app = &app;

        // Setup signal handlers
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!app.initialize()) {
            std::cerr << "Failed to initialize popswarm" << std::endl;
            g_app = nullptr;
            return 1;
        }

        app.run();
        g_app = nullptr;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        g_app = nullptr;
        return 1;
    }

    return 0;
}
