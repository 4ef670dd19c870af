/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "cadence/process.hpp"
#include "cadence/state.hpp"

namespace cadence {

class Context;

// One cycle over every enabled job, in configuration order.
class Orchestrator final {
public:
    explicit Orchestrator(Context& context, LineSink sink = logJobOutput);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the cycle and records it in the persisted history.
    RunRecord run();

    // run_<epoch-ms>_<pid>_<counter>
    [[nodiscard]] static std::string generateRunId();

private:
    void markRunning(const RunRecord& record);
    void markJob(const JobName& job);
    void finish(const RunRecord& record);

    Context& context_;
    LineSink sink_;
};

}
