/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <thread>

#include "cadence/process.hpp"

namespace cadence {

class Context;

enum class TriggerResult : uint8_t { Ran, Skipped };

// Runs a cycle immediately and then every intervalHours on its own thread,
// and coordinates shutdown of whatever is in flight.
class Scheduler final {
public:
    explicit Scheduler(Context& context, LineSink sink = logJobOutput);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    Scheduler& operator=(Scheduler&&) = delete;

    // Fails when the data directory or the initial state cannot be written.
    [[nodiscard]] bool start();
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // One cycle, unless a run is already marked in progress. Called by the
    // scheduling thread; callable directly when the loop is not started.
    TriggerResult trigger();

private:
    [[nodiscard]] bool createDataDirectory() noexcept;
    void resetStaleRun();
    void scheduleLoop();

    Context& context_;
    LineSink sink_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    std::thread schedulerThread_;
};

}
