/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>

#include "cadence/config.hpp"
#include "cadence/state.hpp"
#include "cadence/types.hpp"

namespace cadence {

class ProcessHandle;

// The supervisor's single long-lived value: configuration, persisted state,
// the shutdown flag and the job process currently in flight. Built once in
// main and passed by reference to every component.
class Context final {
public:
    Context(ScheduleConfig config, std::filesystem::path dataDir);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;

    [[nodiscard]] const ScheduleConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::filesystem::path& dataDir() const noexcept { return dataDir_; }
    [[nodiscard]] std::filesystem::path jobDirectory(const JobName& job) const { return dataDir_ / job; }
    [[nodiscard]] const StateStore& store() const noexcept { return store_; }

    // Scheduling thread only.
    [[nodiscard]] SupervisorState& state() noexcept { return state_; }
    [[nodiscard]] const SupervisorState& state() const noexcept { return state_; }
    bool persist() noexcept;

    // Wakes every interruptible wait; safe from any thread.
    void requestShutdown() noexcept;
    [[nodiscard]] bool shutdownRequested() const noexcept;
    // Returns true when shutdown was requested before the timeout elapsed.
    bool waitForShutdown(Millis timeout);
    bool waitForShutdownUntil(std::chrono::steady_clock::time_point deadline);

    // Registers the in-flight job process. Refused (false) once shutdown was
    // requested, so the caller must stop the process itself.
    [[nodiscard]] bool attachProcess(std::shared_ptr<ProcessHandle> process);
    void detachProcess() noexcept;
    [[nodiscard]] std::shared_ptr<ProcessHandle> currentProcess() const;

    static constexpr const char* kStateFileName = "scheduler_state.json";

private:
    ScheduleConfig config_;
    std::filesystem::path dataDir_;
    StateStore store_;
    SupervisorState state_;

    mutable std::mutex mutex_;
    std::condition_variable shutdownCondition_;
    bool shutdown_ = false;
    std::shared_ptr<ProcessHandle> process_;
};

}
