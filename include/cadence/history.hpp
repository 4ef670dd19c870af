/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cadence/state.hpp"

namespace cadence {

// Read-only view of a persisted state file. Every query rereads the file, so
// a reader stays current while the daemon keeps writing.
class History {
public:
    explicit History(const std::filesystem::path& statePath) noexcept;

    History(const History&) = delete;
    History& operator=(const History&) = delete;
    History(History&&) noexcept = default;
    History& operator=(History&&) noexcept = default;

    [[nodiscard]] bool exists() const noexcept;
    [[nodiscard]] std::optional<SupervisorState> state() const noexcept;
    [[nodiscard]] std::optional<RunRecord> latest() const noexcept;
    [[nodiscard]] std::optional<RunRecord> get(const std::string& runId) const noexcept;
    [[nodiscard]] std::vector<RunRecord> list(std::size_t max = 10) const noexcept;

private:
    std::filesystem::path statePath_;
};

}
