/*
 * cadence - Scheduler daemon (cadenced)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/clock.hpp"
#include "cadence/config.hpp"
#include "cadence/context.hpp"
#include "cadence/logger.hpp"
#include "cadence/scheduler.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

using namespace cadence;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "cadence Scheduler Daemon\n\n";
    std::cout << "Usage: " << progName << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     Schedule definition (default: avatars.config.json)\n";
    std::cout << "  --data-dir <dir>    State file and per-job directories (default: data)\n";
    std::cout << "  --log-file <file>   Also append log lines to this file\n";
    std::cout << "  -h, --help          Show this help\n";
    std::cout << "  -v, --version       Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CADENCE_LOG_LEVEL   Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << "\n";
    std::cout << "  " << progName << " --config avatars.config.json --data-dir /var/lib/cadence\n";
    std::cout << "  CADENCE_LOG_LEVEL=DEBUG " << progName << "\n";
}

int main(int argc, char* argv[]) {
    std::string configPath = "avatars.config.json";
    std::string dataDir = "data";
    std::string logFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            dataDir = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            logFile = argv[++i];
        } else {
            std::cerr << "Error: Unknown or incomplete argument: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    Logger::initFromEnv();
    setThreadName("Main");
    if (!logFile.empty() && !Logger::setFile(logFile)) {
        std::cerr << "Error: Cannot open log file: " << logFile << "\n";
        return 1;
    }

    ScheduleConfig config;
    try {
        config = loadConfig(configPath);
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: " + std::string(e.what()));
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        Context context(std::move(config), dataDir);
        auto scheduler = std::make_unique<Scheduler>(context);

        if (!scheduler->start()) {
            LOG_ERROR("Failed to start scheduler");
            return 1;
        }

        LOG_INFO("cadence " + std::string(VERSION) + " running, every " +
                 formatDuration(context.config().interval()) + ", data in " + context.dataDir().string());

        while (!g_shutdown_requested && scheduler->isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown requested, stopping scheduler...");
        }
        scheduler->shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Scheduler error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("cadence daemon stopped");
    return 0;
}
