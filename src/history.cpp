/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/history.hpp"
#include "cadence/logger.hpp"
#include <fstream>
#include <sstream>
#include <utility>

namespace cadence {

History::History(const std::filesystem::path& statePath) noexcept
    : statePath_(statePath) {
    LOG_DEBUG("History created for state file: " + statePath_.string());
}

bool History::exists() const noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(statePath_, ec);
}

std::optional<SupervisorState> History::state() const noexcept {
    try {
        if (!exists()) {
            LOG_DEBUG("State file not found: " + statePath_.string());
            return std::nullopt;
        }

        std::ifstream file(statePath_);
        if (!file) {
            LOG_ERROR("Cannot open state file: " + statePath_.string());
            return std::nullopt;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return deserializeState(buffer.str());

    } catch (const std::exception& e) {
        LOG_ERROR("Error reading state file " + statePath_.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<RunRecord> History::latest() const noexcept {
    std::vector<RunRecord> runs = list(1);
    if (runs.empty()) {
        return std::nullopt;
    }
    return runs.front();
}

std::optional<RunRecord> History::get(const std::string& runId) const noexcept {
    auto current = state();
    if (!current) {
        return std::nullopt;
    }
    for (const auto& record : current->runHistory) {
        if (record.runId == runId) {
            return record;
        }
    }
    LOG_DEBUG("Run not found: " + runId);
    return std::nullopt;
}

std::vector<RunRecord> History::list(std::size_t max) const noexcept {
    std::vector<RunRecord> runs;
    try {
        auto current = state();
        if (!current) {
            return runs;
        }
        // History is persisted newest first.
        runs = std::move(current->runHistory);
        if (runs.size() > max) {
            runs.resize(max);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing runs: " + std::string(e.what()));
    }
    return runs;
}

}
