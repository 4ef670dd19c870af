/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cadence/types.hpp"

namespace cadence {

inline constexpr std::size_t kMaxRunHistory = 100;

struct JobRunResult {
    JobName jobName;
    bool success = false;
    TimePoint startTime{};
    TimePoint endTime{};
    std::int64_t durationMs = 0;
    int exitCode = -1;
    std::optional<std::string> errorMessage;
    int attempt = 0;

    bool operator==(const JobRunResult& other) const;
};

struct RunRecord {
    std::string runId;
    TimePoint startTime{};
    TimePoint endTime{};
    std::int64_t durationMs = 0;
    std::vector<JobRunResult> jobsProcessed;
    RunStatus status = RunStatus::Completed;

    bool operator==(const RunRecord& other) const;
};

struct SupervisorState {
    std::optional<TimePoint> lastRunStartTime;
    std::optional<TimePoint> lastRunEndTime;
    std::optional<TimePoint> nextScheduledRun;
    bool isRunning = false;
    std::optional<JobName> currentJob;
    std::vector<RunRecord> runHistory;   // newest first

    bool operator==(const SupervisorState& other) const;
};

[[nodiscard]] const char* toString(RunStatus status) noexcept;
[[nodiscard]] std::optional<RunStatus> parseRunStatus(const std::string& text) noexcept;

// completed iff all succeeded, failed iff none did, partial otherwise
[[nodiscard]] RunStatus classifyRun(const std::vector<JobRunResult>& results) noexcept;

// Prepends the record and evicts the oldest entries beyond kMaxRunHistory.
void appendRun(SupervisorState& state, RunRecord record);

[[nodiscard]] std::string serializeState(const SupervisorState& state);
// Throws std::runtime_error on malformed documents.
[[nodiscard]] SupervisorState deserializeState(const std::string& text);

class StateStore final {
public:
    explicit StateStore(std::filesystem::path path);

    // Missing or unreadable state yields a fresh default; never throws.
    [[nodiscard]] SupervisorState load() const noexcept;
    // Whole-document overwrite through a temp file and rename; false on failure.
    [[nodiscard]] bool save(const SupervisorState& state) const noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}
