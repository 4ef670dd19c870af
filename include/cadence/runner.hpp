/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "cadence/config.hpp"
#include "cadence/process.hpp"
#include "cadence/state.hpp"

namespace cadence {

class Context;

// Runs one job with bounded retries. Each attempt is a fresh process watched
// by a LivenessMonitor; the delay between attempts is cut short by shutdown.
class JobRunner final {
public:
    explicit JobRunner(Context& context, LineSink sink = logJobOutput);

    JobRunner(const JobRunner&) = delete;
    JobRunner& operator=(const JobRunner&) = delete;

    // First successful attempt, or the last failed one once retries are
    // exhausted (or shutdown stopped further attempts).
    [[nodiscard]] JobRunResult run(const JobSpec& job);

private:
    [[nodiscard]] bool ensureJobDirectory(const JobSpec& job) noexcept;
    [[nodiscard]] JobRunResult runAttempt(const JobSpec& job, int attempt);

    Context& context_;
    LineSink sink_;
};

}
