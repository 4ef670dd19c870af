/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/scheduler.hpp"
#include "cadence/clock.hpp"
#include "cadence/context.hpp"
#include "cadence/logger.hpp"
#include "cadence/orchestrator.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace cadence {

// Note: Signal handling is done by the CLI (cadenced.cpp), not by Scheduler

Scheduler::Scheduler(Context& context, LineSink sink)
    : context_(context), sink_(std::move(sink)) {
    LOG_DEBUG("Scheduler created - interval: " + formatDuration(context_.config().interval()));
}

Scheduler::~Scheduler() {
    shutdown();
}

bool Scheduler::start() {
    if (running_.load()) {
        LOG_WARN("Scheduler already running");
        return false;
    }

    LOG_INFO("Starting cadence scheduler...");

    if (!createDataDirectory()) {
        LOG_ERROR("Failed to create data directory");
        return false;
    }

    resetStaleRun();

    if (!context_.persist()) {
        LOG_ERROR("Failed to persist initial state to " + context_.store().path().string());
        return false;
    }

    const ScheduleConfig& config = context_.config();
    LOG_DEBUG("========================================");
    LOG_DEBUG("cadence Scheduler Starting");
    LOG_DEBUG("========================================");
    LOG_DEBUG("Data dir: " + context_.dataDir().string());
    LOG_DEBUG("Interval: " + formatDuration(config.interval()));
    LOG_DEBUG("Jobs: " + std::to_string(config.enabledJobs().size()) + " enabled of " +
              std::to_string(config.jobs.size()));
    LOG_DEBUG("cadence Log Level: " + std::string(getenv("CADENCE_LOG_LEVEL") ? getenv("CADENCE_LOG_LEVEL") : "INFO"));
    LOG_DEBUG("========================================");

    try {
        running_.store(true);
        schedulerThread_ = std::thread(&Scheduler::scheduleLoop, this);
        LOG_DEBUG("Scheduler started successfully");
        return true;
    } catch (const std::exception& e) {
        running_.store(false);
        LOG_ERROR("Failed to start scheduler: " + std::string(e.what()));
        return false;
    }
}

void Scheduler::shutdown() noexcept {
    if (!running_.exchange(false)) {
        if (stopped_.load()) {
            LOG_DEBUG("Scheduler already shut down");
        }
        return;
    }

    LOG_INFO("Shutting down scheduler...");
    context_.requestShutdown();

    try {
        if (auto process = context_.currentProcess()) {
            LOG_INFO("Waiting up to " + formatDuration(context_.config().shutdownGrace) + " for job " +
                     process->jobName() + " to exit");
            process->terminate(context_.config().shutdownGrace);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error stopping in-flight job: " + std::string(e.what()));
    }

    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }

    SupervisorState& state = context_.state();
    state.isRunning = false;
    state.currentJob.reset();
    state.nextScheduledRun.reset();
    if (!context_.persist()) {
        LOG_ERROR("Failed to persist final state");
    }

    stopped_.store(true);
    LOG_INFO("Scheduler shutdown complete");
}

TriggerResult Scheduler::trigger() {
    if (context_.state().isRunning) {
        LOG_WARN("Run already in progress, skipping this cycle");
        return TriggerResult::Skipped;
    }
    if (context_.shutdownRequested()) {
        LOG_DEBUG("Shutdown requested, not starting a new run");
        return TriggerResult::Skipped;
    }

    try {
        Orchestrator orchestrator(context_, sink_);
        (void)orchestrator.run();
    } catch (const std::exception& e) {
        LOG_ERROR("Run aborted: " + std::string(e.what()));
        context_.state().isRunning = false;
        context_.state().currentJob.reset();
    }

    auto next = now() + context_.config().interval();
    context_.state().nextScheduledRun = next;
    context_.persist();
    LOG_INFO("Next run scheduled at " + formatIso8601(next));
    return TriggerResult::Ran;
}

bool Scheduler::createDataDirectory() noexcept {
    try {
        std::filesystem::create_directories(context_.dataDir());
        LOG_DEBUG("Data directory ready: " + context_.dataDir().string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create data directory: " + std::string(e.what()));
        return false;
    }
}

void Scheduler::resetStaleRun() {
    SupervisorState& state = context_.state();
    if (!state.isRunning) {
        return;
    }
    LOG_WARN("Previous run did not finish cleanly" +
             (state.currentJob ? " (was running " + *state.currentJob + ")" : std::string()) +
             ", resetting to idle");
    state.isRunning = false;
    state.currentJob.reset();
}

void Scheduler::scheduleLoop() {
    setThreadName("Scheduler");
    LOG_DEBUG("Scheduler loop started");

    const Millis interval = context_.config().interval();
    const auto origin = std::chrono::steady_clock::now();
    std::int64_t tick = 0;

    while (!context_.shutdownRequested()) {
        try {
            (void)trigger();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler loop error: " + std::string(e.what()));
        }

        // Ticks that passed during the run are dropped, not queued.
        auto elapsed = std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - origin);
        std::int64_t nextTick = elapsed / interval + 1;
        if (nextTick > tick + 1) {
            LOG_WARN("Skipped " + std::to_string(nextTick - tick - 1) +
                     " scheduled run(s) while a run was in progress");
        }
        tick = nextTick;

        if (context_.waitForShutdownUntil(origin + interval * tick)) {
            break;
        }
    }

    LOG_DEBUG("Scheduler loop stopped");
    clearThreadName();
}

}
