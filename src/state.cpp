/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/state.hpp"
#include "cadence/clock.hpp"
#include "cadence/logger.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace cadence {

namespace {

using json = nlohmann::json;

json timeToJson(const std::optional<TimePoint>& tp) {
    if (!tp) {
        return nullptr;
    }
    return formatIso8601(*tp);
}

TimePoint requireTime(const json& value, const char* key) {
    if (!value.is_string()) {
        throw std::runtime_error(std::string("\"") + key + "\" must be a timestamp string");
    }
    auto tp = parseIso8601(value.get<std::string>());
    if (!tp) {
        throw std::runtime_error(std::string("\"") + key + "\" is not an ISO-8601 timestamp");
    }
    return *tp;
}

std::optional<TimePoint> optionalTime(const json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::nullopt;
    }
    return requireTime(*it, key);
}

json resultToJson(const JobRunResult& result) {
    json j = {
        {"jobName", result.jobName},
        {"success", result.success},
        {"startTime", formatIso8601(result.startTime)},
        {"endTime", formatIso8601(result.endTime)},
        {"durationMs", result.durationMs},
        {"exitCode", result.exitCode},
        {"attempt", result.attempt},
    };
    if (result.errorMessage) {
        j["errorMessage"] = *result.errorMessage;
    }
    return j;
}

JobRunResult resultFromJson(const json& j) {
    JobRunResult result;
    // Older state files call jobs avatars
    auto name = j.find("jobName");
    if (name == j.end()) {
        name = j.find("avatarName");
    }
    if (name == j.end()) {
        throw std::runtime_error("run result has no \"jobName\"");
    }
    result.jobName = name->get<std::string>();
    result.success = j.at("success").get<bool>();
    result.startTime = requireTime(j.at("startTime"), "startTime");
    result.endTime = requireTime(j.at("endTime"), "endTime");
    result.durationMs = j.at("durationMs").get<std::int64_t>();
    result.exitCode = j.at("exitCode").get<int>();
    result.attempt = j.at("attempt").get<int>();
    auto message = j.find("errorMessage");
    if (message != j.end() && !message->is_null()) {
        result.errorMessage = message->get<std::string>();
    }
    return result;
}

json recordToJson(const RunRecord& record) {
    json jobs = json::array();
    for (const auto& result : record.jobsProcessed) {
        jobs.push_back(resultToJson(result));
    }
    return {
        {"runId", record.runId},
        {"startTime", formatIso8601(record.startTime)},
        {"endTime", formatIso8601(record.endTime)},
        {"durationMs", record.durationMs},
        {"jobsProcessed", std::move(jobs)},
        {"status", toString(record.status)},
    };
}

RunRecord recordFromJson(const json& j) {
    RunRecord record;
    record.runId = j.at("runId").get<std::string>();
    record.startTime = requireTime(j.at("startTime"), "startTime");
    record.endTime = requireTime(j.at("endTime"), "endTime");
    record.durationMs = j.at("durationMs").get<std::int64_t>();
    auto jobs = j.find("jobsProcessed");
    if (jobs == j.end()) {
        jobs = j.find("avatarsProcessed");
    }
    if (jobs == j.end() || !jobs->is_array()) {
        throw std::runtime_error("run record " + record.runId + " has no \"jobsProcessed\" array");
    }
    for (const auto& result : *jobs) {
        record.jobsProcessed.push_back(resultFromJson(result));
    }
    auto status = parseRunStatus(j.at("status").get<std::string>());
    if (!status) {
        throw std::runtime_error("Unknown run status: " + j.at("status").get<std::string>());
    }
    record.status = *status;
    return record;
}

}

bool JobRunResult::operator==(const JobRunResult& other) const {
    return jobName == other.jobName && success == other.success &&
           startTime == other.startTime && endTime == other.endTime &&
           durationMs == other.durationMs && exitCode == other.exitCode &&
           errorMessage == other.errorMessage && attempt == other.attempt;
}

bool RunRecord::operator==(const RunRecord& other) const {
    return runId == other.runId && startTime == other.startTime &&
           endTime == other.endTime && durationMs == other.durationMs &&
           jobsProcessed == other.jobsProcessed && status == other.status;
}

bool SupervisorState::operator==(const SupervisorState& other) const {
    return lastRunStartTime == other.lastRunStartTime &&
           lastRunEndTime == other.lastRunEndTime &&
           nextScheduledRun == other.nextScheduledRun &&
           isRunning == other.isRunning && currentJob == other.currentJob &&
           runHistory == other.runHistory;
}

const char* toString(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Partial: return "partial";
        default: return "unknown";
    }
}

std::optional<RunStatus> parseRunStatus(const std::string& text) noexcept {
    if (text == "completed") return RunStatus::Completed;
    if (text == "failed") return RunStatus::Failed;
    if (text == "partial") return RunStatus::Partial;
    return std::nullopt;
}

RunStatus classifyRun(const std::vector<JobRunResult>& results) noexcept {
    std::size_t succeeded = 0;
    for (const auto& result : results) {
        if (result.success) {
            ++succeeded;
        }
    }
    if (succeeded == results.size()) {
        return RunStatus::Completed;
    }
    if (succeeded == 0) {
        return RunStatus::Failed;
    }
    return RunStatus::Partial;
}

void appendRun(SupervisorState& state, RunRecord record) {
    state.runHistory.insert(state.runHistory.begin(), std::move(record));
    if (state.runHistory.size() > kMaxRunHistory) {
        state.runHistory.resize(kMaxRunHistory);
    }
}

std::string serializeState(const SupervisorState& state) {
    json history = json::array();
    for (const auto& record : state.runHistory) {
        history.push_back(recordToJson(record));
    }
    json doc = {
        {"lastRunStartTime", timeToJson(state.lastRunStartTime)},
        {"lastRunEndTime", timeToJson(state.lastRunEndTime)},
        {"nextScheduledRun", timeToJson(state.nextScheduledRun)},
        {"isRunning", state.isRunning},
        {"currentJob", state.currentJob ? json(*state.currentJob) : json(nullptr)},
        {"runHistory", std::move(history)},
    };
    return doc.dump(4);
}

SupervisorState deserializeState(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
        if (!doc.is_object()) {
            throw std::runtime_error("state document is not an object");
        }

        SupervisorState state;
        state.lastRunStartTime = optionalTime(doc, "lastRunStartTime");
        state.lastRunEndTime = optionalTime(doc, "lastRunEndTime");
        state.nextScheduledRun = optionalTime(doc, "nextScheduledRun");
        state.isRunning = doc.value("isRunning", false);

        auto current = doc.find("currentJob");
        if (current == doc.end()) {
            // Older state files call it currentAvatar
            current = doc.find("currentAvatar");
        }
        if (current != doc.end() && !current->is_null()) {
            state.currentJob = current->get<std::string>();
        }

        auto history = doc.find("runHistory");
        if (history != doc.end() && !history->is_null()) {
            for (const auto& record : *history) {
                state.runHistory.push_back(recordFromJson(record));
            }
        }
        if (state.runHistory.size() > kMaxRunHistory) {
            state.runHistory.resize(kMaxRunHistory);
        }
        return state;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("malformed state document: ") + e.what());
    }
}

StateStore::StateStore(std::filesystem::path path) : path_(std::move(path)) {
    LOG_DEBUG("StateStore created for: " + path_.string());
}

SupervisorState StateStore::load() const noexcept {
    try {
        if (!std::filesystem::exists(path_)) {
            LOG_INFO("No previous state at " + path_.string() + ", starting fresh");
            return {};
        }

        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            LOG_WARN("Failed to open state file " + path_.string() + ", starting fresh");
            return {};
        }
        std::string content((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

        SupervisorState state = deserializeState(content);
        LOG_DEBUG("Loaded state with " + std::to_string(state.runHistory.size()) + " run(s) of history");
        return state;
    } catch (const std::exception& e) {
        LOG_WARN("Ignoring unreadable state file " + path_.string() + ": " + e.what());
        return {};
    } catch (...) {
        LOG_WARN("Ignoring unreadable state file " + path_.string());
        return {};
    }
}

bool StateStore::save(const SupervisorState& state) const noexcept {
    auto tempPath = path_;
    tempPath += ".tmp";
    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        // Write the whole document to a temporary file first
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                LOG_ERROR("Failed to open " + tempPath.string() + " for writing");
                return false;
            }
            file << serializeState(state);
            file.flush();
            if (!file.good()) {
                LOG_ERROR("Failed to write scheduler state to " + tempPath.string());
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return false;
            }
        }

        std::filesystem::rename(tempPath, path_);
        LOG_TRACE("State saved to " + path_.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save scheduler state: " + std::string(e.what()));
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        return false;
    } catch (...) {
        LOG_ERROR("Unknown error saving scheduler state");
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        return false;
    }
}

}
