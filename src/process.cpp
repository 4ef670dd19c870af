/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "cadence/process.hpp"
#include "cadence/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <chrono>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace cadence {

namespace {

std::int64_t steadyMillis() noexcept {
    return std::chrono::duration_cast<Millis>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// PATH lookup done before fork so the child only execs.
std::optional<std::string> resolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= dirs.size()) {
        std::size_t end = dirs.find(':', start);
        if (end == std::string::npos) {
            end = dirs.size();
        }
        std::string dir = dirs.substr(start, end - start);
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::vector<std::string> childEnvironment(const JobName& jobName) {
    std::vector<std::string> env;
    const std::string prefix = std::string(kJobNameEnv) + "=";
    for (char** entry = environ; entry && *entry; ++entry) {
        if (std::strncmp(*entry, prefix.c_str(), prefix.size()) != 0) {
            env.emplace_back(*entry);
        }
    }
    env.push_back(prefix + jobName);
    return env;
}

std::vector<char*> toCArray(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& value : values) {
        out.push_back(value.data());
    }
    out.push_back(nullptr);
    return out;
}

}

void logJobOutput(const JobName& job, OutputStream stream, const std::string& line) {
    if (stream == OutputStream::Stderr) {
        LOG_WARN("[" + job + "] " + line);
    } else {
        LOG_DEBUG("[" + job + "] " + line);
    }
}

ProcessHandle::ProcessHandle(Token, JobName jobName, LineSink sink)
    : jobName_(std::move(jobName)), sink_(std::move(sink)) {
    touch();
}

ProcessHandle::~ProcessHandle() {
    if (!hasExited()) {
        LOG_WARN("Process for " + jobName_ + " still running at teardown, killing it");
        terminate(Millis::zero());
    }
    try {
        (void)wait();
    } catch (...) {
        LOG_ERROR("Failed to reap process for " + jobName_);
    }
    if (readerThread_.joinable()) {
        readerThread_.join();
    }
}

std::shared_ptr<ProcessHandle> ProcessHandle::spawn(const std::vector<std::string>& argv,
                                                    const JobName& jobName,
                                                    LineSink sink) {
    auto handle = std::make_shared<ProcessHandle>(Token{}, jobName, std::move(sink));

    if (argv.empty() || argv.front().empty()) {
        handle->failSpawn("empty command");
        return handle;
    }
    auto executable = resolveExecutable(argv.front());
    if (!executable) {
        handle->failSpawn(argv.front() + ": command not found");
        return handle;
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> args(argv);
    std::vector<std::string> env = childEnvironment(jobName);
    std::vector<char*> cargs = toCArray(args);
    std::vector<char*> cenv = toCArray(env);

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execPipe, O_CLOEXEC) != 0) {
        std::string error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        handle->failSpawn(error);
        return handle;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        std::string error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fds : {outPipe, errPipe, execPipe}) {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
        handle->failSpawn(error);
        return handle;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);

        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
            if (devNull != STDIN_FILENO) {
                ::close(devNull);
            }
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);

        struct sigaction sa;
        std::memset(&sa, 0, sizeof sa);
        sa.sa_handler = SIG_DFL;
        for (int sig : {SIGINT, SIGTERM, SIGPIPE, SIGCHLD}) {
            ::sigaction(sig, &sa, nullptr);
        }
        sigset_t mask;
        ::sigemptyset(&mask);
        ::sigprocmask(SIG_SETMASK, &mask, nullptr);

        ::execve(executable->c_str(), cargs.data(), cenv.data());

        int err = errno;
        ssize_t ignored = ::write(execPipe[1], &err, sizeof err);
        (void)ignored;
        ::_exit(127);
    }

    // Parent. Also set the group here so terminate() cannot race the child.
    ::setpgid(pid, pid);
    handle->pid_ = pid;

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execErrno, sizeof execErrno);
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof execErrno)) {
        // exec failed; the child has already exited with 127
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        handle->pid_ = -1;
        handle->failSpawn(*executable + ": " + std::strerror(execErrno));
        return handle;
    }

    LOG_DEBUG("Spawned " + jobName + " as pid " + std::to_string(pid) + ": " + *executable);
    handle->readerThread_ = std::thread(&ProcessHandle::readLoop, handle.get(), outPipe[0], errPipe[0]);
    return handle;
}

void ProcessHandle::failSpawn(std::string error) {
    LOG_ERROR("Failed to spawn process for " + jobName_ + ": " + error);
    std::lock_guard<std::mutex> lock(mutex_);
    ExitStatus status;
    status.spawnFailed = true;
    status.error = std::move(error);
    status_ = status;
    exited_ = true;
    exitCondition_.notify_all();
}

ExitStatus ProcessHandle::wait() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_) {
            return *status_;
        }
    }

    // Wait without reaping so the group id stays valid until we are done with it
    siginfo_t info;
    std::memset(&info, 0, sizeof info);
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) {
            LOG_ERROR("waitid failed for " + jobName_ + ": " + std::strerror(errno));
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        exited_ = true;
    }
    exitCondition_.notify_all();

    if (terminating_.load()) {
        // Leader is gone; sweep whatever it left behind in its group
        ::killpg(pid_, SIGKILL);
    }

    ExitStatus status;
    int raw = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(pid_, &raw, 0);
    } while (reaped < 0 && errno == EINTR);

    if (reaped == pid_) {
        if (WIFEXITED(raw)) {
            status.exitCode = WEXITSTATUS(raw);
        } else if (WIFSIGNALED(raw)) {
            status.signal = WTERMSIG(raw);
            status.exitCode = -1;
        }
    } else {
        status.error = std::string("waitpid failed: ") + std::strerror(errno);
    }

    stopReading_.store(true);
    if (readerThread_.joinable()) {
        readerThread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
    return status;
}

void ProcessHandle::terminate(Millis grace) noexcept {
    try {
        std::unique_lock<std::mutex> lock(mutex_);
        if (exited_) {
            return;
        }

        if (!terminating_.exchange(true)) {
            LOG_INFO("Sending SIGTERM to process group of " + jobName_ + " (pid " + std::to_string(pid_) + ")");
            if (::killpg(pid_, SIGTERM) != 0 && errno != ESRCH) {
                LOG_ERROR("Failed to signal " + jobName_ + ": " + std::strerror(errno));
            }
        }

        if (exitCondition_.wait_for(lock, grace, [this] { return exited_; })) {
            return;
        }

        if (!killed_.exchange(true)) {
            LOG_WARN("Process " + jobName_ + " did not exit within " + std::to_string(grace.count()) +
                     "ms, sending SIGKILL");
            if (::killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
                LOG_ERROR("Failed to kill " + jobName_ + ": " + std::strerror(errno));
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error terminating " + jobName_ + ": " + e.what());
    }
}

bool ProcessHandle::hasExited() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}

Millis ProcessHandle::idleFor() const noexcept {
    return Millis(steadyMillis() - lastActivityMs_.load());
}

void ProcessHandle::touch() noexcept {
    lastActivityMs_.store(steadyMillis());
}

void ProcessHandle::emitLines(OutputStream stream, std::string& buffer, bool flushPartial) {
    std::size_t start = 0;
    std::size_t newline;
    while ((newline = buffer.find('\n', start)) != std::string::npos) {
        std::string line = buffer.substr(start, newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && sink_) {
            sink_(jobName_, stream, line);
        }
        start = newline + 1;
    }
    buffer.erase(0, start);
    if (flushPartial && !buffer.empty()) {
        if (sink_) {
            sink_(jobName_, stream, buffer);
        }
        buffer.clear();
    }
}

void ProcessHandle::readLoop(int outFd, int errFd) {
    setThreadName("Output-" + jobName_);

    int fds[2] = {outFd, errFd};
    std::string buffers[2];
    const OutputStream streams[2] = {OutputStream::Stdout, OutputStream::Stderr};
    char chunk[4096];

    try {
        while (fds[0] >= 0 || fds[1] >= 0) {
            pollfd pfds[2];
            nfds_t count = 0;
            int index[2];
            for (int i = 0; i < 2; ++i) {
                if (fds[i] >= 0) {
                    pfds[count].fd = fds[i];
                    pfds[count].events = POLLIN;
                    pfds[count].revents = 0;
                    index[count] = i;
                    ++count;
                }
            }

            // Once the process is gone, only drain what is already buffered;
            // grandchildren may keep the pipes open indefinitely.
            const bool draining = stopReading_.load();
            int ready = ::poll(pfds, count, draining ? 0 : 100);
            if (ready < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("poll failed on output of " + jobName_ + ": " + std::strerror(errno));
                break;
            }
            if (ready == 0) {
                if (draining) break;
                continue;
            }

            for (nfds_t p = 0; p < count; ++p) {
                if (pfds[p].revents == 0) continue;
                int i = index[p];
                ssize_t n = ::read(fds[i], chunk, sizeof chunk);
                if (n > 0) {
                    touch();
                    buffers[i].append(chunk, static_cast<std::size_t>(n));
                    emitLines(streams[i], buffers[i], false);
                } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    closeFd(fds[i]);
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Output reader for " + jobName_ + " failed: " + e.what());
    }

    for (int i = 0; i < 2; ++i) {
        try {
            emitLines(streams[i], buffers[i], true);
        } catch (...) {
            LOG_ERROR("Failed to forward trailing output of " + jobName_);
        }
        closeFd(fds[i]);
    }
    LOG_TRACE("Output reader for " + jobName_ + " stopped");
    clearThreadName();
}

}
