/*
 * File:        render_controller.h
 * Module:      ropmon-core
 * Purpose:     Starts, stops and owns the single active render job
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_RENDER_CONTROLLER_H
#define ROPMON_CORE_RENDER_CONTROLLER_H

#include "event_channel.h"
#include "monitor_config.h"
#include "render_command.h"
#include "render_events.h"
#include "render_job.h"
#include "render_monitor.h"
#include "rop_metadata.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace ropmon {

/**
 * @brief Application-level owner of render jobs
 *
 * At most one job runs at a time. Each job gets its own process, session
 * and monitor thread; the controller hands out the event channel all of
 * them publish to. start(), interrupt(), kill() and wait() are meant for
 * the control thread; events() may be drained from any thread.
 */
class RenderController {
public:
    /**
     * @param config Configuration for every job started by this controller
     * @param rop_provider Consulted for jobs without an explicit range (may be null)
     */
    explicit RenderController(MonitorConfig config, RopMetadataProvider* rop_provider = nullptr);
    ~RenderController();

    RenderController(const RenderController&) = delete;
    RenderController& operator=(const RenderController&) = delete;

    /**
     * @brief Start a render job
     *
     * Without an explicit range the ROP provider is asked for the node's
     * range and skip setting first; a skip enabled on the ROP is kept even
     * when the job does not ask for it. interrupt() or kill() during that
     * query cancels the start.
     * @return False if a job is already running or the start was canceled
     * @throws SpawnError if the render backend cannot be launched
     */
    bool start(const RenderJob& job);

    /**
     * @brief Finish the current frame, then stop
     *
     * A second interrupt of the same job escalates to kill().
     * @return False if nothing is rendering or starting
     */
    bool interrupt();

    /**
     * @brief Stop immediately
     * @return False if nothing is rendering or the job was already killed
     */
    bool kill();

    /// True from a successful start() until the monitor thread has finished
    bool is_rendering() const { return rendering_.load(); }

    /// Block until the current job's monitor thread has finished
    void wait();

    EventChannel<RenderEvent>& events() { return events_; }

    /// Command line of the most recent job
    const std::optional<RenderCommand>& last_command() const { return command_; }

private:
    std::optional<RopSettings> query_rop(const RenderJob& job);
    bool kill_locked();
    void join_worker();
    void publish_text(std::string text, const char* color, bool bold = false, bool center = false);

    MonitorConfig config_;
    RopMetadataProvider* rop_provider_;
    EventChannel<RenderEvent> events_;

    std::mutex control_mutex_;
    bool starting_ = false;          ///< Guarded by control_mutex_
    bool start_canceled_ = false;    ///< Guarded by control_mutex_
    std::optional<RenderJob> job_;
    std::optional<RenderCommand> command_;
    std::unique_ptr<CancelFlags> flags_;
    std::unique_ptr<ProcessSupervisor> process_;
    std::unique_ptr<RenderSession> session_;
    std::unique_ptr<RenderMonitor> monitor_;
    std::thread worker_;
    std::atomic<bool> rendering_{false};
};

} // namespace ropmon

#endif // ROPMON_CORE_RENDER_CONTROLLER_H
