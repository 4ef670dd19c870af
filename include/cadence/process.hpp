/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "cadence/types.hpp"

namespace cadence {

// Environment variable carrying the job name into the child.
inline constexpr const char* kJobNameEnv = "AVATAR_NAME";

struct ExitStatus {
    int exitCode = -1;
    int signal = 0;            // terminating signal, 0 when the process exited
    bool spawnFailed = false;
    std::string error;         // reason the process could not be started

    [[nodiscard]] bool success() const noexcept { return !spawnFailed && signal == 0 && exitCode == 0; }
};

enum class OutputStream : uint8_t { Stdout, Stderr };

using LineSink = std::function<void(const JobName&, OutputStream, const std::string&)>;

// Default sink: stdout at DEBUG, stderr at WARN, tagged with the job name.
void logJobOutput(const JobName& job, OutputStream stream, const std::string& line);

class ProcessHandle final {
    // Restricts construction to spawn() while still allowing make_shared.
    struct Token {};

public:
    // Starts argv in its own process group with AVATAR_NAME=jobName added to
    // the inherited environment. Spawn failures are reported by wait().
    [[nodiscard]] static std::shared_ptr<ProcessHandle> spawn(const std::vector<std::string>& argv,
                                                              const JobName& jobName,
                                                              LineSink sink = logJobOutput);
    ProcessHandle(Token, JobName jobName, LineSink sink);
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&&) = delete;
    ProcessHandle& operator=(ProcessHandle&&) = delete;

    // Blocks until the process has exited and its output is drained.
    // Only the owning thread may call it; later calls return the cached status.
    [[nodiscard]] ExitStatus wait();

    // SIGTERM to the process group (sent once), then SIGKILL if the process
    // is still alive after grace. Callable from any thread.
    void terminate(Millis grace) noexcept;

    [[nodiscard]] bool hasExited() const noexcept;
    [[nodiscard]] bool terminationRequested() const noexcept { return terminating_.load(); }
    [[nodiscard]] bool forceKilled() const noexcept { return killed_.load(); }
    [[nodiscard]] Millis idleFor() const noexcept;
    // Process group leader, -1 when the spawn failed.
    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const JobName& jobName() const noexcept { return jobName_; }

private:
    void readLoop(int outFd, int errFd);
    void touch() noexcept;
    void emitLines(OutputStream stream, std::string& buffer, bool flushPartial);
    void failSpawn(std::string error);

    JobName jobName_;
    LineSink sink_;
    pid_t pid_ = -1;

    std::atomic<std::int64_t> lastActivityMs_{0};
    std::atomic<bool> terminating_{false};
    std::atomic<bool> killed_{false};
    std::atomic<bool> stopReading_{false};

    mutable std::mutex mutex_;
    std::condition_variable exitCondition_;
    bool exited_ = false;      // leader gone; no signal may target the group anymore
    std::optional<ExitStatus> status_;

    std::thread readerThread_;
};

}
