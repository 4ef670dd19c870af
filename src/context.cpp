/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/context.hpp"
#include "cadence/logger.hpp"
#include "cadence/process.hpp"

namespace cadence {

Context::Context(ScheduleConfig config, std::filesystem::path dataDir)
    : config_(std::move(config)),
      dataDir_(std::move(dataDir)),
      store_(dataDir_ / kStateFileName),
      state_(store_.load()) {
    LOG_DEBUG("Context created - data dir: " + dataDir_.string() + ", jobs: " +
              std::to_string(config_.jobs.size()));
}

bool Context::persist() noexcept {
    return store_.save(state_);
}

void Context::requestShutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    shutdownCondition_.notify_all();
}

bool Context::shutdownRequested() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

bool Context::waitForShutdown(Millis timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return shutdownCondition_.wait_for(lock, timeout, [this] { return shutdown_; });
}

bool Context::waitForShutdownUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return shutdownCondition_.wait_until(lock, deadline, [this] { return shutdown_; });
}

bool Context::attachProcess(std::shared_ptr<ProcessHandle> process) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
        return false;
    }
    process_ = std::move(process);
    return true;
}

void Context::detachProcess() noexcept {
    std::shared_ptr<ProcessHandle> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.swap(process_);
    }
}

std::shared_ptr<ProcessHandle> Context::currentProcess() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_;
}

}
