/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/orchestrator.hpp"
#include "cadence/clock.hpp"
#include "cadence/context.hpp"
#include "cadence/logger.hpp"
#include "cadence/runner.hpp"
#include <atomic>
#include <cstdint>
#include <utility>
#include <unistd.h>

namespace cadence {

Orchestrator::Orchestrator(Context& context, LineSink sink)
    : context_(context), sink_(std::move(sink)) {
}

std::string Orchestrator::generateRunId() {
    static std::atomic<uint64_t> counter{0};
    auto ms = now().time_since_epoch().count();
    return "run_" + std::to_string(ms) + "_" + std::to_string(getpid()) + "_" +
           std::to_string(counter.fetch_add(1));
}

RunRecord Orchestrator::run() {
    RunRecord record;
    record.runId = generateRunId();
    record.startTime = now();

    auto jobs = context_.config().enabledJobs();
    LOG_INFO("Starting run " + record.runId + " with " + std::to_string(jobs.size()) + " job(s)");
    markRunning(record);

    JobRunner runner(context_, sink_);
    for (const auto& job : jobs) {
        if (context_.shutdownRequested()) {
            LOG_INFO("Shutdown requested, skipping remaining jobs");
            break;
        }
        markJob(job.name);
        record.jobsProcessed.push_back(runner.run(job));
    }

    record.endTime = now();
    record.durationMs = (record.endTime - record.startTime).count();
    record.status = classifyRun(record.jobsProcessed);
    finish(record);
    return record;
}

void Orchestrator::markRunning(const RunRecord& record) {
    SupervisorState& state = context_.state();
    state.isRunning = true;
    state.currentJob.reset();
    state.lastRunStartTime = record.startTime;
    context_.persist();
}

void Orchestrator::markJob(const JobName& job) {
    context_.state().currentJob = job;
    context_.persist();
}

void Orchestrator::finish(const RunRecord& record) {
    SupervisorState& state = context_.state();
    appendRun(state, record);
    state.isRunning = false;
    state.currentJob.reset();
    state.lastRunEndTime = record.endTime;
    context_.persist();

    std::size_t succeeded = 0;
    for (const auto& result : record.jobsProcessed) {
        if (result.success) {
            succeeded++;
        }
    }

    std::string summary = "Run " + record.runId + " " + toString(record.status) + ": " +
                          std::to_string(succeeded) + "/" + std::to_string(record.jobsProcessed.size()) +
                          " job(s) succeeded in " + formatDuration(Millis(record.durationMs));
    if (record.status == RunStatus::Completed) {
        LOG_INFO(summary);
    } else {
        LOG_WARN(summary);
    }
    for (const auto& result : record.jobsProcessed) {
        if (!result.success) {
            LOG_WARN("  " + result.jobName + ": " + result.errorMessage.value_or("unknown error"));
        }
    }
}

}
