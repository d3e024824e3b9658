/*
 * File:        process_supervisor.cpp
 * Module:      ropmon-core
 * Purpose:     Lifecycle of one external render subprocess
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "process_supervisor.h"
#include "logging.h"

#include <fmt/format.h>
#include <thread>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ropmon {

const char* process_state_name(ProcessState state) {
    switch (state) {
        case ProcessState::NotStarted:   return "not-started";
        case ProcessState::Running:      return "running";
        case ProcessState::Interrupting: return "interrupting";
        case ProcessState::Exited:       return "exited";
        case ProcessState::Killed:       return "killed";
    }
    return "unknown";
}

ProcessSupervisor::~ProcessSupervisor() {
    if (pid_ > 0 && is_running()) {
        ROPMON_LOG_WARN("ProcessSupervisor: '{}' (pid {}) still running at shutdown, killing", command_, pid_);
        kill();
    }
    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
}

void ProcessSupervisor::start(const std::string& command,
                              const std::vector<std::string>& args,
                              const std::string& working_directory) {
    if (state_.load() != ProcessState::NotStarted) {
        throw std::runtime_error("ProcessSupervisor: a process has already been started");
    }

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        throw SpawnError(fmt::format("Failed to create output pipe: {}", std::strerror(err)), err);
    }

    // The child reports an exec failure through this pipe; a successful
    // exec closes it (O_CLOEXEC) and the parent reads EOF.
    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw SpawnError(fmt::format("Failed to create status pipe: {}", std::strerror(err)), err);
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(command);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const char* workdir = working_directory.empty() ? nullptr : working_directory.c_str();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw SpawnError(fmt::format("Failed to fork for '{}': {}", command, std::strerror(err)), err);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);

        if (workdir != nullptr && ::chdir(workdir) != 0) {
            int err = errno;
            ssize_t written = ::write(err_pipe[1], &err, sizeof(err));
            (void)written;
            ::_exit(127);
        }

        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t written = ::write(err_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    // Parent. Also set the group here so that signals sent before the child
    // gets scheduled still reach the right group.
    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ::close(out_pipe[0]);
        throw SpawnError(fmt::format("Failed to start '{}': {}", command, std::strerror(child_errno)),
                         child_errno);
    }

    int flags = ::fcntl(out_pipe[0], F_GETFL, 0);
    if (flags < 0 || ::fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK) != 0) {
        ROPMON_LOG_WARN("ProcessSupervisor: unable to make output pipe non-blocking: {}", std::strerror(errno));
    }

    command_ = command;
    pid_ = pid;
    output_fd_ = out_pipe[0];
    state_ = ProcessState::Running;

    ROPMON_LOG_INFO("Started '{}' (pid {})", command, pid);
}

void ProcessSupervisor::reap_locked(bool block) {
    if (exit_code_ || pid_ <= 0) {
        return;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return;  // Still running
    }

    if (result == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
    } else {
        // ECHILD: nothing left to wait for
        ROPMON_LOG_WARN("ProcessSupervisor: waitpid({}) failed: {}", pid_, std::strerror(errno));
        exit_code_ = -1;
    }

    if (state_.load() != ProcessState::Killed) {
        state_ = ProcessState::Exited;
    }
    ROPMON_LOG_INFO("Process {} finished with exit code {} ({})",
                    pid_, *exit_code_, process_state_name(state_.load()));
}

bool ProcessSupervisor::request_graceful_stop() {
    if (!is_running()) {
        return false;
    }

    bool expected = false;
    if (!graceful_sent_.compare_exchange_strong(expected, true)) {
        return false;
    }

    ProcessState running = ProcessState::Running;
    state_.compare_exchange_strong(running, ProcessState::Interrupting);

    if (::kill(pid_, SIGUSR1) == 0) {
        ROPMON_LOG_INFO("Sent graceful stop request (SIGUSR1) to pid {}", pid_);
        return true;
    }

    int err = errno;
    ROPMON_LOG_WARN("SIGUSR1 to pid {} failed ({}), sending SIGTERM to the process group", pid_, std::strerror(err));
    if (::killpg(pid_, SIGTERM) != 0) {
        // Most likely the process is already gone
        ROPMON_LOG_DEBUG("SIGTERM to process group {} failed: {}", pid_, std::strerror(errno));
    }
    return true;
}

InterruptOutcome ProcessSupervisor::interrupt() {
    if (graceful_sent_.load()) {
        if (!is_running()) {
            return InterruptOutcome::NotRunning;
        }
        ROPMON_LOG_INFO("Interrupt requested while already interrupting, escalating to kill");
        kill();
        return InterruptOutcome::Escalated;
    }

    return request_graceful_stop() ? InterruptOutcome::GracefulSignalSent : InterruptOutcome::NotRunning;
}

void ProcessSupervisor::kill() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0) {
        return;
    }

    reap_locked(false);
    if (exit_code_) {
        return;
    }

    state_ = ProcessState::Killed;

    if (::killpg(pid_, SIGKILL) != 0) {
        int err = errno;
        if (err == ESRCH) {
            ROPMON_LOG_DEBUG("Process group {} already gone", pid_);
        } else {
            ROPMON_LOG_WARN("SIGKILL to process group {} failed: {}", pid_, std::strerror(err));
        }
        if (::kill(pid_, SIGKILL) != 0) {
            ROPMON_LOG_DEBUG("SIGKILL to pid {} failed: {}", pid_, std::strerror(errno));
        }
    } else {
        ROPMON_LOG_INFO("Sent SIGKILL to process group {}", pid_);
    }

    reap_locked(true);
}

bool ProcessSupervisor::is_running() {
    if (pid_ <= 0) {
        return false;
    }
    return !poll_exit_code().has_value();
}

std::optional<int> ProcessSupervisor::poll_exit_code() {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (pid_ <= 0) {
        return std::nullopt;
    }
    reap_locked(false);
    return exit_code_;
}

bool ProcessSupervisor::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

} // namespace ropmon
