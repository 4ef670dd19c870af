/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "cadence/types.hpp"

namespace cadence {

// Tick deadlines are steady_clock nanoseconds; longer intervals overflow them.
inline constexpr double kMaxIntervalHours = 1'000'000.0;

struct JobSpec {
    JobName name;
    bool enabled = true;
};

struct ScheduleConfig {
    double intervalHours = 0.0;
    int maxRetries = 3;
    Millis retryDelay{60'000};
    Millis processTimeout{1'800'000};   // loaded and reported, never enforced
    Millis inactivityTimeout{600'000};
    Millis livenessCheckInterval{60'000};
    Millis killGrace{5'000};
    Millis shutdownGrace{30'000};
    std::vector<std::string> command{"npx", "ts-node", "src/index.ts"};
    std::vector<JobSpec> jobs;

    [[nodiscard]] Millis interval() const noexcept;
    [[nodiscard]] std::vector<JobSpec> enabledJobs() const;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Both throw ConfigError; the supervisor must not start on an invalid schedule.
[[nodiscard]] ScheduleConfig loadConfig(const std::filesystem::path& path);
[[nodiscard]] ScheduleConfig parseConfig(const std::string& text);

}
