/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "cadence/types.hpp"

namespace cadence {

class ProcessHandle;

// Kills a job that has produced no output for the inactivity timeout.
// Checks on its own thread at a fixed cadence, independent of the timeout.
class LivenessMonitor final {
public:
    LivenessMonitor(std::shared_ptr<ProcessHandle> process, Millis inactivityTimeout,
                    Millis checkInterval, Millis killGrace);
    ~LivenessMonitor();

    LivenessMonitor(const LivenessMonitor&) = delete;
    LivenessMonitor& operator=(const LivenessMonitor&) = delete;
    LivenessMonitor(LivenessMonitor&&) = delete;
    LivenessMonitor& operator=(LivenessMonitor&&) = delete;

    bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    // True once the job was presumed stuck and terminated.
    [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

private:
    void checkLoop();

    std::shared_ptr<ProcessHandle> process_;
    Millis inactivityTimeout_;
    Millis checkInterval_;
    Millis killGrace_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopRequested_ = false;

    std::atomic<bool> running_{false};
    std::atomic<bool> fired_{false};
    std::thread checkThread_;
};

}
