/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/runner.hpp"
#include "cadence/clock.hpp"
#include "cadence/context.hpp"
#include "cadence/logger.hpp"
#include "cadence/monitor.hpp"
#include <filesystem>
#include <thread>
#include <utility>

namespace cadence {

JobRunner::JobRunner(Context& context, LineSink sink)
    : context_(context), sink_(std::move(sink)) {
}

JobRunResult JobRunner::run(const JobSpec& job) {
    const ScheduleConfig& config = context_.config();

    if (!ensureJobDirectory(job)) {
        JobRunResult result;
        result.jobName = job.name;
        result.startTime = now();
        result.endTime = result.startTime;
        result.errorMessage = "Failed to create working directory " + context_.jobDirectory(job.name).string();
        return result;
    }

    JobRunResult last;
    for (int attempt = 1; attempt <= config.maxRetries; ++attempt) {
        LOG_INFO("Running job " + job.name + " (attempt " + std::to_string(attempt) + "/" +
                 std::to_string(config.maxRetries) + ")");

        JobRunResult result = runAttempt(job, attempt);
        if (result.success) {
            LOG_INFO("Job " + job.name + " completed successfully in " +
                     formatDuration(Millis(result.durationMs)));
            return result;
        }

        LOG_WARN("Job " + job.name + " failed on attempt " + std::to_string(attempt) + ": " +
                 result.errorMessage.value_or("unknown error"));
        last = std::move(result);

        if (attempt < config.maxRetries) {
            LOG_INFO("Retrying job " + job.name + " in " + formatDuration(config.retryDelay));
            if (context_.waitForShutdown(config.retryDelay)) {
                LOG_INFO("Shutdown requested, not retrying job " + job.name);
                last.errorMessage = "Shutdown requested after attempt " + std::to_string(attempt) + ": " +
                                    last.errorMessage.value_or("unknown error");
                return last;
            }
        }
    }

    LOG_ERROR("Job " + job.name + " failed after " + std::to_string(config.maxRetries) + " attempts");
    last.errorMessage = "Failed after " + std::to_string(config.maxRetries) + " attempts: " +
                        last.errorMessage.value_or("unknown error");
    return last;
}

bool JobRunner::ensureJobDirectory(const JobSpec& job) noexcept {
    try {
        auto path = context_.jobDirectory(job.name);
        if (std::filesystem::is_directory(path)) {
            return true;
        }
        std::filesystem::create_directories(path);
        LOG_INFO("Created directory for job " + job.name + ": " + path.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create directory for job " + job.name + ": " + std::string(e.what()));
        return false;
    }
}

JobRunResult JobRunner::runAttempt(const JobSpec& job, int attempt) {
    const ScheduleConfig& config = context_.config();

    JobRunResult result;
    result.jobName = job.name;
    result.attempt = attempt;
    result.startTime = now();

    auto process = ProcessHandle::spawn(config.command, job.name, sink_);
    std::thread stopper;
    if (!context_.attachProcess(process)) {
        // Nobody else will stop it; terminate() needs wait() running to see the exit
        LOG_INFO("Shutdown already requested, stopping " + job.name + " right away");
        stopper = std::thread([process, grace = config.shutdownGrace] { process->terminate(grace); });
    }

    LivenessMonitor monitor(process, config.inactivityTimeout, config.livenessCheckInterval, config.killGrace);
    if (!process->hasExited() && !monitor.start()) {
        LOG_WARN("Running " + job.name + " without liveness monitoring");
    }

    ExitStatus status = process->wait();
    if (stopper.joinable()) {
        stopper.join();
    }
    monitor.stop();
    context_.detachProcess();

    result.endTime = now();
    result.durationMs = (result.endTime - result.startTime).count();
    result.exitCode = status.exitCode;
    result.success = status.success();

    if (result.success) {
        return result;
    }

    if (status.spawnFailed) {
        result.errorMessage = "Failed to spawn: " + status.error;
    } else if (monitor.fired()) {
        result.errorMessage = "Killed after " + formatDuration(config.inactivityTimeout) + " without output";
        if (process->forceKilled()) {
            *result.errorMessage += " (SIGKILL after " + formatDuration(config.killGrace) + " grace)";
        }
    } else if (process->terminationRequested()) {
        result.errorMessage = "Terminated by shutdown";
        if (process->forceKilled()) {
            *result.errorMessage += " (SIGKILL after " + formatDuration(config.shutdownGrace) + " grace)";
        }
    } else if (status.signal != 0) {
        result.errorMessage = "Terminated by signal " + std::to_string(status.signal);
    } else if (!status.error.empty()) {
        result.errorMessage = status.error;
    } else {
        result.errorMessage = "Exited with code " + std::to_string(status.exitCode);
    }
    return result;
}

}
