/*
 * File:        process_supervisor.h
 * Module:      ropmon-core
 * Purpose:     Lifecycle of one external render subprocess
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_PROCESS_SUPERVISOR_H
#define ROPMON_CORE_PROCESS_SUPERVISOR_H

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace ropmon {

/**
 * @brief The render backend could not be launched
 *
 * Raised by ProcessSupervisor::start() when fork fails or the child cannot
 * exec the command (missing executable, permission denied, bad working
 * directory). Carries the errno reported by the child.
 */
class SpawnError : public std::runtime_error {
public:
    SpawnError(const std::string& message, int error_code)
        : std::runtime_error(message), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

/**
 * @brief Process lifetime states
 *
 * NotStarted -> Running -> { Interrupting -> Killed | Interrupting -> Exited
 *                          | Running -> Exited | Running -> Killed }
 *
 * Interrupting is entered once and is sticky.
 */
enum class ProcessState {
    NotStarted,
    Running,
    Interrupting,
    Exited,
    Killed
};

const char* process_state_name(ProcessState state);

/// Result of ProcessSupervisor::interrupt()
enum class InterruptOutcome {
    GracefulSignalSent,   ///< First interrupt: graceful-stop signal delivered
    Escalated,            ///< Already interrupting: process was killed
    NotRunning            ///< Nothing to interrupt
};

/**
 * @brief Owns one external process and its combined stdout/stderr pipe
 *
 * The child runs in its own process group so that terminate/kill signals
 * reach anything it spawns. The read end of the output pipe is non-blocking
 * and is closed when the supervisor is destroyed.
 *
 * Thread safety: interrupt(), kill(), is_running() and poll_exit_code() may
 * be called from any thread. start() must complete before any of them.
 */
class ProcessSupervisor {
public:
    ProcessSupervisor() = default;
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief Spawn the process
     *
     * @param command Executable name (resolved through PATH) or path
     * @param args Arguments, not including argv[0]
     * @param working_directory Directory to run in (empty = inherit)
     * @throws SpawnError if the process could not be launched
     */
    void start(const std::string& command,
               const std::vector<std::string>& args,
               const std::string& working_directory = "");

    /**
     * @brief Request a graceful stop (finish current frame)
     *
     * Sends SIGUSR1 to the process; if that cannot be delivered, falls back
     * to SIGTERM for the whole process group. A second call while already
     * interrupting escalates to kill().
     */
    InterruptOutcome interrupt();

    /**
     * @brief Send the graceful-stop signal unless it was already sent
     * @return True if the signal was sent by this call
     */
    bool request_graceful_stop();

    /**
     * @brief SIGKILL the whole process group and wait for the exit
     *
     * No-op if the process has already exited.
     */
    void kill();

    /// True iff the process was started and has not yet exited
    bool is_running();

    /// Non-blocking exit status (128 + signal number when killed by a signal)
    std::optional<int> poll_exit_code();

    /// Wait up to timeout for the process to exit on its own
    bool wait_for_exit(std::chrono::milliseconds timeout);

    ProcessState state() const { return state_.load(); }
    bool graceful_stop_sent() const { return graceful_sent_.load(); }
    pid_t pid() const { return pid_; }

    /// Read end of the combined stdout/stderr pipe (-1 before start)
    int output_fd() const { return output_fd_; }

private:
    void reap_locked(bool block);

    pid_t pid_ = -1;
    int output_fd_ = -1;
    std::string command_;

    std::atomic<ProcessState> state_{ProcessState::NotStarted};
    std::atomic<bool> graceful_sent_{false};

    std::mutex wait_mutex_;
    std::optional<int> exit_code_;
};

} // namespace ropmon

#endif // ROPMON_CORE_PROCESS_SUPERVISOR_H
