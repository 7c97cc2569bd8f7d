#include "app/App.hpp"
#include "app/Log.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>

static std::atomic<bool> g_sigint{false};

static void handle_signal(int) {
    g_sigint.store(true);
}

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <path>]\n";
}

int main(int argc, char** argv) {
    std::string configPath = "config/config.yaml";
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    App app(configPath);
    try {
        app.init();
    } catch (const std::exception& e) {
        std::cerr << "[fatal] init failed: " << e.what() << "\n";
        return 2;
    }

    // Signals
    std::signal(SIGINT,  handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        app.start();
    } catch (const std::exception& e) {
        logError("main") << "start failed: " << e.what();
        app.stop();
        return 2;
    }

    // Run until Ctrl+C (or systemd stop)
    while (!g_sigint.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logInfo("main") << "signal received; stopping...";
    app.stop();
    return 0;
}
