/*
 * File:        render_monitor.cpp
 * Module:      ropmon-core
 * Purpose:     Monitor loop tying the render process to the session
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_monitor.h"
#include "log_line_reader.h"
#include "logging.h"

namespace ropmon {

const char* monitor_phase_name(MonitorPhase phase) {
    switch (phase) {
        case MonitorPhase::Starting:              return "starting";
        case MonitorPhase::Monitoring:            return "monitoring";
        case MonitorPhase::GracefulStopRequested: return "graceful-stop-requested";
        case MonitorPhase::ForceKilled:           return "force-killed";
        case MonitorPhase::Finished:              return "finished";
    }
    return "unknown";
}

RenderMonitor::RenderMonitor(ProcessSupervisor& process, RenderSession& session,
                             const MonitorSettings& settings, const CancelFlags& flags)
    : process_(process)
    , session_(session)
    , settings_(settings)
    , flags_(flags)
{
}

void RenderMonitor::run() {
    ROPMON_LOG_DEBUG("RenderMonitor: loop started for pid {}", process_.pid());

    try {
        monitor_loop();
        settle_process();
    } catch (const std::exception& e) {
        ROPMON_LOG_ERROR("RenderMonitor: exception in monitor loop: {}", e.what());
        if (process_.is_running()) {
            process_.kill();
        }
    }

    JobEnd end;
    end.killed = flags_.killed.load() || process_.state() == ProcessState::Killed;
    end.exit_code = process_.poll_exit_code();
    session_.finish(RenderSession::Clock::now(), end);

    set_phase(MonitorPhase::Finished);
    ROPMON_LOG_DEBUG("RenderMonitor: loop exiting");
}

void RenderMonitor::set_phase(MonitorPhase phase) {
    MonitorPhase previous = phase_.exchange(phase);
    if (previous != phase) {
        ROPMON_LOG_DEBUG("RenderMonitor: {} -> {}", monitor_phase_name(previous), monitor_phase_name(phase));
    }
}

void RenderMonitor::monitor_loop() {
    LineReader reader(process_.output_fd());
    const std::chrono::milliseconds timeout(settings_.read_timeout_ms);

    session_.begin(RenderSession::Clock::now());
    set_phase(MonitorPhase::Monitoring);

    while (true) {
        session_.tick(RenderSession::Clock::now());

        if (flags_.killed.load()) {
            set_phase(MonitorPhase::ForceKilled);
            return;
        }

        ReadResult result = reader.read_line(timeout);

        if (flags_.killed.load()) {
            set_phase(MonitorPhase::ForceKilled);
            return;
        }

        if (result.status == ReadStatus::Closed) {
            ROPMON_LOG_DEBUG("RenderMonitor: output stream closed");
            return;
        }

        if (result.status == ReadStatus::Timeout) {
            if (flags_.canceling.load()) {
                set_phase(MonitorPhase::GracefulStopRequested);
                if (!session_.frame_in_progress()) {
                    graceful_exit_ = true;
                    return;
                }
                if (!process_.graceful_stop_sent()) {
                    process_.request_graceful_stop();
                }
            }
            // Anything still holding the pipe open is not the render process
            if (!process_.is_running()) {
                ROPMON_LOG_DEBUG("RenderMonitor: process exited with the output stream still open");
                return;
            }
            continue;
        }

        std::string line = normalize_log_line(decode_log_bytes(result.line), settings_.strip_prefixes);
        LineOutcome outcome = session_.process_line(line, RenderSession::Clock::now());

        if (outcome.frame_ended && flags_.canceling.load() && process_.graceful_stop_sent()) {
            ROPMON_LOG_INFO("Frame finished after interrupt request, stopping");
            graceful_exit_ = true;
            return;
        }
    }
}

void RenderMonitor::settle_process() {
    if (!process_.is_running()) {
        return;
    }

    if (flags_.killed.load()) {
        process_.kill();
        return;
    }

    if (graceful_exit_ && !process_.graceful_stop_sent()) {
        process_.request_graceful_stop();
    }

    const std::chrono::milliseconds grace(settings_.graceful_exit_timeout_ms);
    if (!process_.wait_for_exit(grace)) {
        ROPMON_LOG_WARN("Render process {} did not exit within {} ms, killing", process_.pid(),
                        settings_.graceful_exit_timeout_ms);
        process_.kill();
    }
}

} // namespace ropmon
