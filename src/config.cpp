/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/config.hpp"
#include "cadence/clock.hpp"
#include "cadence/logger.hpp"
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace cadence {

namespace {

using json = nlohmann::json;

// Reads an optional non-negative millisecond field; absent keeps the default.
void readMillis(const json& doc, const char* key, Millis& out, bool allowZero) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string("\"") + key + "\" must be an integer (milliseconds)");
    }
    auto value = it->get<long long>();
    if (value < 0 || (value == 0 && !allowZero)) {
        throw ConfigError(std::string("\"") + key + "\" must be " + (allowZero ? "zero or positive" : "positive"));
    }
    out = Millis(value);
}

bool isSafeName(const std::string& name) noexcept {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::vector<JobSpec> readJobs(const json& doc) {
    auto it = doc.find("jobs");
    if (it == doc.end()) {
        // Older schedule files call them avatars
        it = doc.find("avatars");
    }
    if (it == doc.end() || !it->is_array()) {
        throw ConfigError("Configuration must include a \"jobs\" array");
    }
    if (it->empty()) {
        throw ConfigError("Configuration \"jobs\" array must not be empty");
    }

    std::vector<JobSpec> jobs;
    std::unordered_set<std::string> seen;
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            throw ConfigError("Each job must be an object with a \"name\"");
        }
        auto name = entry.find("name");
        if (name == entry.end() || !name->is_string()) {
            throw ConfigError("Each job must have a string \"name\"");
        }

        JobSpec job;
        job.name = name->get<std::string>();
        if (!isSafeName(job.name)) {
            throw ConfigError("Invalid job name: \"" + job.name + "\"");
        }
        if (!seen.insert(job.name).second) {
            throw ConfigError("Duplicate job name: \"" + job.name + "\"");
        }

        auto enabled = entry.find("enabled");
        if (enabled != entry.end() && !enabled->is_null()) {
            if (!enabled->is_boolean()) {
                throw ConfigError("\"enabled\" of job \"" + job.name + "\" must be a boolean");
            }
            job.enabled = enabled->get<bool>();
        }
        jobs.push_back(std::move(job));
    }
    return jobs;
}

}

Millis ScheduleConfig::interval() const noexcept {
    return Millis(static_cast<long long>(std::llround(intervalHours * 3'600'000.0)));
}

std::vector<JobSpec> ScheduleConfig::enabledJobs() const {
    std::vector<JobSpec> enabled;
    for (const auto& job : jobs) {
        if (job.enabled) {
            enabled.push_back(job);
        }
    }
    return enabled;
}

ScheduleConfig parseConfig(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
    if (!doc.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    ScheduleConfig config;
    config.jobs = readJobs(doc);

    auto interval = doc.find("intervalHours");
    if (interval == doc.end() || !interval->is_number()) {
        throw ConfigError("Configuration must include valid \"intervalHours\" (positive number)");
    }
    config.intervalHours = interval->get<double>();
    if (!std::isfinite(config.intervalHours) || config.intervalHours <= 0.0 ||
        config.intervalHours > kMaxIntervalHours || config.interval() <= Millis::zero()) {
        throw ConfigError("Configuration must include valid \"intervalHours\" (positive number, at most " +
                          std::to_string(static_cast<long long>(kMaxIntervalHours)) + ")");
    }

    auto retries = doc.find("maxRetries");
    if (retries != doc.end() && !retries->is_null()) {
        if (!retries->is_number_integer()) {
            throw ConfigError("\"maxRetries\" must be an integer");
        }
        auto value = retries->get<long long>();
        if (value < 1 || value > std::numeric_limits<int>::max()) {
            throw ConfigError("\"maxRetries\" must be at least 1");
        }
        config.maxRetries = static_cast<int>(value);
    }

    readMillis(doc, "retryDelayMs", config.retryDelay, true);
    readMillis(doc, "processTimeoutMs", config.processTimeout, false);
    readMillis(doc, "inactivityTimeoutMs", config.inactivityTimeout, false);
    readMillis(doc, "livenessCheckIntervalMs", config.livenessCheckInterval, false);
    readMillis(doc, "killGraceMs", config.killGrace, true);
    readMillis(doc, "shutdownGraceMs", config.shutdownGrace, true);

    auto command = doc.find("command");
    if (command != doc.end() && !command->is_null()) {
        if (!command->is_array() || command->empty()) {
            throw ConfigError("\"command\" must be a non-empty array of strings");
        }
        std::vector<std::string> argv;
        for (const auto& arg : *command) {
            if (!arg.is_string()) {
                throw ConfigError("\"command\" must be a non-empty array of strings");
            }
            argv.push_back(arg.get<std::string>());
        }
        if (argv.front().empty()) {
            throw ConfigError("\"command\" must name an executable");
        }
        config.command = std::move(argv);
    }

    return config;
}

ScheduleConfig loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ConfigError("Configuration file not found: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    ScheduleConfig config = parseConfig(content);

    std::string enabled;
    for (const auto& job : config.enabledJobs()) {
        enabled += (enabled.empty() ? "" : ", ") + job.name;
    }
    LOG_INFO("Configuration loaded from " + path.string() + ": interval " +
             formatDuration(config.interval()) + ", " + std::to_string(config.jobs.size()) +
             " job(s), enabled [" + enabled + "]");
    LOG_DEBUG("maxRetries=" + std::to_string(config.maxRetries) +
              " retryDelayMs=" + std::to_string(config.retryDelay.count()) +
              " inactivityTimeoutMs=" + std::to_string(config.inactivityTimeout.count()) +
              " processTimeoutMs=" + std::to_string(config.processTimeout.count()) + " (not enforced)");
    return config;
}

}
