/*
 * cadence - Run history tool (hst)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/clock.hpp"
#include "cadence/history.hpp"
#include "cadence/logger.hpp"
#include <iostream>
#include <optional>
#include <string>

using namespace cadence;

void printUsage(const char* progName) {
    std::cout << "cadence Run History Tool\n\n";
    std::cout << "Usage: " << progName << " [--state <file>] [run_id] [-n <count>]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  --state <file>  State file (default: data/scheduler_state.json)\n";
    std::cout << "  run_id          Show one run with its per-job results (optional)\n";
    std::cout << "  -n <count>      Number of recent runs to list (default: 10)\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If run_id provided: print that run in detail\n";
    std::cout << "  - If no run_id: print scheduler status and recent runs\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  CADENCE_LOG_LEVEL  Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << "\n";
    std::cout << "  " << progName << " -n 3\n";
    std::cout << "  " << progName << " run_1731808123456_12345_0\n";
}

std::string formatOptional(const std::optional<TimePoint>& when) {
    return when ? formatIso8601(*when) : "-";
}

void printRunLine(const RunRecord& run) {
    std::cout << run.runId << "  " << formatIso8601(run.startTime) << "  " << toString(run.status)
              << "  " << run.jobsProcessed.size() << " job(s)  " << formatDuration(Millis(run.durationMs)) << "\n";
}

void printRunDetail(const RunRecord& run) {
    std::cout << "Run:       " << run.runId << "\n";
    std::cout << "Status:    " << toString(run.status) << "\n";
    std::cout << "Started:   " << formatIso8601(run.startTime) << "\n";
    std::cout << "Finished:  " << formatIso8601(run.endTime) << "\n";
    std::cout << "Duration:  " << formatDuration(Millis(run.durationMs)) << "\n\n";
    for (const auto& job : run.jobsProcessed) {
        std::cout << "  " << (job.success ? "ok    " : "FAILED") << "  " << job.jobName
                  << "  attempt " << job.attempt << "  exit " << job.exitCode
                  << "  " << formatDuration(Millis(job.durationMs)) << "\n";
        if (job.errorMessage) {
            std::cout << "          " << *job.errorMessage << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);

    std::string statePath = "data/scheduler_state.json";
    std::string runId;
    std::size_t count = 10;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--state" && i + 1 < argc) {
            statePath = argv[++i];
        } else if (arg == "-n" && i + 1 < argc) {
            try {
                count = static_cast<std::size_t>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid count\n";
                return 1;
            }
        } else {
            runId = arg;
        }
    }

    try {
        History history(statePath);

        auto state = history.state();
        if (!state) {
            std::cerr << "No state found at " << statePath << std::endl;
            return 1;
        }

        if (!runId.empty()) {
            auto run = history.get(runId);
            if (!run) {
                std::cerr << "Run not found: " << runId << std::endl;
                return 1;
            }
            printRunDetail(*run);
            return 0;
        }

        std::cout << "Running:   " << (state->isRunning ? "yes" : "no");
        if (state->currentJob) {
            std::cout << " (" << *state->currentJob << ")";
        }
        std::cout << "\n";
        std::cout << "Last run:  " << formatOptional(state->lastRunStartTime) << "\n";
        std::cout << "Last end:  " << formatOptional(state->lastRunEndTime) << "\n";
        std::cout << "Next run:  " << formatOptional(state->nextScheduledRun) << "\n\n";

        auto runs = history.list(count);
        if (runs.empty()) {
            std::cout << "No runs recorded" << std::endl;
            return 0;
        }
        for (const auto& run : runs) {
            printRunLine(run);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
