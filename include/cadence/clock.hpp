/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>

#include "cadence/types.hpp"

namespace cadence {

// Wall clock truncated to milliseconds, the precision of the state file.
[[nodiscard]] TimePoint now() noexcept;

// 2026-10-19T08:30:00.125Z
[[nodiscard]] std::string formatIso8601(TimePoint tp);
[[nodiscard]] std::optional<TimePoint> parseIso8601(const std::string& text) noexcept;

// Human readable duration for log lines: 850ms, 12.4s, 3m 7s
[[nodiscard]] std::string formatDuration(Millis duration);

}
