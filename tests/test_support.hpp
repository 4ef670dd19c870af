#pragma once

#include <cadence/config.hpp>
#include <cadence/process.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cadence::test {

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "cadence-test-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline std::vector<std::string> shell(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

inline std::vector<JobSpec> jobs(std::initializer_list<std::pair<const char*, bool>> specs) {
    std::vector<JobSpec> out;
    for (const auto& spec : specs) {
        JobSpec job;
        job.name = spec.first;
        job.enabled = spec.second;
        out.push_back(job);
    }
    return out;
}

// Short timeouts so failure paths finish quickly.
inline ScheduleConfig fastConfig(std::vector<std::string> command, std::vector<JobSpec> jobList) {
    ScheduleConfig config;
    config.intervalHours = 1.0;
    config.maxRetries = 3;
    config.retryDelay = Millis(0);
    config.inactivityTimeout = Millis(5'000);
    config.livenessCheckInterval = Millis(50);
    config.killGrace = Millis(300);
    config.shutdownGrace = Millis(300);
    config.command = std::move(command);
    config.jobs = std::move(jobList);
    return config;
}

inline int countLines(const std::filesystem::path& path) {
    std::ifstream file(path);
    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++count;
    }
    return count;
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    file << content;
}

// Sink that keeps every line for inspection.
class CapturedOutput {
public:
    LineSink sink() {
        return [this](const JobName& job, OutputStream stream, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back({job, stream, line});
        };
    }

    struct Line {
        JobName job;
        OutputStream stream;
        std::string text;
    };

    std::vector<Line> lines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Line> lines_;
};

}
