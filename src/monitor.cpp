/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/monitor.hpp"
#include "cadence/clock.hpp"
#include "cadence/logger.hpp"
#include "cadence/process.hpp"
#include <utility>

namespace cadence {

LivenessMonitor::LivenessMonitor(std::shared_ptr<ProcessHandle> process, Millis inactivityTimeout,
                                 Millis checkInterval, Millis killGrace)
    : process_(std::move(process)),
      inactivityTimeout_(inactivityTimeout),
      checkInterval_(checkInterval),
      killGrace_(killGrace) {
}

LivenessMonitor::~LivenessMonitor() {
    stop();
}

bool LivenessMonitor::start() {
    if (running_.load()) {
        LOG_WARN("Liveness monitor already running");
        return false;
    }
    if (!process_) {
        LOG_ERROR("Liveness monitor has no process to watch");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = false;
    }
    try {
        running_.store(true);
        checkThread_ = std::thread(&LivenessMonitor::checkLoop, this);
        LOG_DEBUG("Watching " + process_->jobName() + " for " + formatDuration(inactivityTimeout_) +
                  " of inactivity (checked every " + formatDuration(checkInterval_) + ")");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start liveness monitor: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void LivenessMonitor::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    wake_.notify_all();

    if (checkThread_.joinable()) {
        checkThread_.join();
    }
    running_.store(false);
}

void LivenessMonitor::checkLoop() {
    setThreadName("Liveness-" + process_->jobName());

    try {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopRequested_) {
            if (wake_.wait_for(lock, checkInterval_, [this] { return stopRequested_; })) {
                break;
            }
            if (process_->hasExited()) {
                break;
            }

            Millis idle = process_->idleFor();
            if (idle < inactivityTimeout_ || fired_.load()) {
                continue;
            }

            if (!fired_.exchange(true)) {
                LOG_ERROR("Job " + process_->jobName() + " stuck - no output for " + formatDuration(idle) +
                          ", killing process");
                // terminate() may block for the kill grace; do not hold our lock meanwhile
                lock.unlock();
                process_->terminate(killGrace_);
                lock.lock();
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Liveness monitor error: " + std::string(e.what()));
    }

    LOG_TRACE("Liveness monitor for " + process_->jobName() + " stopped");
    clearThreadName();
}

}
