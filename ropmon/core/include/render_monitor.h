/*
 * File:        render_monitor.h
 * Module:      ropmon-core
 * Purpose:     Monitor loop tying the render process to the session
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_RENDER_MONITOR_H
#define ROPMON_CORE_RENDER_MONITOR_H

#include "monitor_config.h"
#include "process_supervisor.h"
#include "render_session.h"

#include <atomic>

namespace ropmon {

/**
 * @brief Cancellation requests, written by the control thread
 *
 * The monitor thread only reads these.
 */
struct CancelFlags {
    std::atomic<bool> canceling{false};   ///< Stop after the current frame
    std::atomic<bool> killed{false};      ///< Stop now
};

/**
 * @brief Lifecycle of one monitor loop
 *
 * Starting -> Monitoring -> { GracefulStopRequested | ForceKilled } -> Finished.
 * A graceful stop keeps draining output until the frame in flight ends.
 */
enum class MonitorPhase {
    Starting,
    Monitoring,
    GracefulStopRequested,
    ForceKilled,
    Finished
};

const char* monitor_phase_name(MonitorPhase phase);

/**
 * @brief Runs the monitor loop for one job
 *
 * Each iteration refreshes the time labels, reads one line with a bounded
 * timeout, checks the cancellation flags and feeds the line to the
 * session. The loop ends when the output stream closes, the process exits,
 * a kill is requested, or a requested graceful stop has reached a frame
 * boundary. run() always finishes the session, which publishes
 * JobFinished exactly once, even if the loop fails.
 */
class RenderMonitor {
public:
    RenderMonitor(ProcessSupervisor& process, RenderSession& session,
                  const MonitorSettings& settings, const CancelFlags& flags);

    void run();

    /// May be read from any thread
    MonitorPhase phase() const { return phase_.load(); }

private:
    void set_phase(MonitorPhase phase);
    void monitor_loop();
    void settle_process();

    ProcessSupervisor& process_;
    RenderSession& session_;
    const MonitorSettings& settings_;
    const CancelFlags& flags_;
    std::atomic<MonitorPhase> phase_{MonitorPhase::Starting};
    bool graceful_exit_ = false;
};

} // namespace ropmon

#endif // ROPMON_CORE_RENDER_MONITOR_H
