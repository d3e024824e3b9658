/*
 * File:        render_controller.cpp
 * Module:      ropmon-core
 * Purpose:     Starts, stops and owns the single active render job
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_controller.h"
#include "logging.h"
#include "time_format.h"

#include <utility>

namespace ropmon {

RenderController::RenderController(MonitorConfig config, RopMetadataProvider* rop_provider)
    : config_(std::move(config))
    , rop_provider_(rop_provider)
{
}

RenderController::~RenderController() {
    if (rendering_.load()) {
        ROPMON_LOG_WARN("RenderController: render still active at shutdown, killing");
        kill();
    }
    join_worker();
}

bool RenderController::start(const RenderJob& job) {
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (rendering_.load() || starting_) {
            ROPMON_LOG_WARN("RenderController: a render is already running");
            return false;
        }
        starting_ = true;
        start_canceled_ = false;
    }

    // The scene load can take minutes; interrupt() stays responsive meanwhile
    RenderJob effective = job;
    std::optional<RopSettings> rop;
    if (!job.frame_range && rop_provider_) {
        rop = query_rop(job);
        if (rop && rop->skip_existing && !effective.skip_existing) {
            ROPMON_LOG_INFO("ROP '{}' skips frames that are already rendered", job.out_node_path);
            effective.skip_existing = true;
        }
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    starting_ = false;
    if (start_canceled_) {
        ROPMON_LOG_INFO("Render of '{}' canceled before it started", job.out_node_path);
        return false;
    }

    // Previous job's monitor thread has finished; collect it
    join_worker();
    monitor_.reset();
    session_.reset();
    process_.reset();
    flags_.reset();

    RenderCommand command = build_render_command(config_.render, effective);

    auto flags = std::make_unique<CancelFlags>();
    auto session = std::make_unique<RenderSession>(effective.frame_range, config_.monitor, events_);
    if (rop) {
        session->announce_range(rop->range(), FrameTotalSource::FromRopMetadata, RenderSession::Clock::now());
    }

    auto process = std::make_unique<ProcessSupervisor>();
    process->start(command.program, command.args);

    publish_text("\n\n RENDER STARTED AT " + format_banner_time(RenderSession::Clock::now()) + "\n\n",
                 text_color::BANNER, true, true);
    publish_text(command.to_string() + "\n\n", text_color::COMMAND);
    publish_text("Loading scene...\n", text_color::DIM);

    job_ = effective;
    command_ = std::move(command);
    flags_ = std::move(flags);
    process_ = std::move(process);
    session_ = std::move(session);
    monitor_ = std::make_unique<RenderMonitor>(*process_, *session_, config_.monitor, *flags_);

    rendering_ = true;
    worker_ = std::thread([this] {
        monitor_->run();
        ROPMON_LOG_DEBUG("RenderController: monitor ended in phase {}", monitor_phase_name(monitor_->phase()));
        rendering_ = false;
    });

    return true;
}

std::optional<RopSettings> RenderController::query_rop(const RenderJob& job) {
    try {
        if (auto rop = rop_provider_->query(job.hip_path, job.out_node_path)) {
            ROPMON_LOG_INFO("ROP '{}' renders frames {}-{} step {}", job.out_node_path,
                            rop->start_frame, rop->end_frame, rop->step);
            return rop;
        }
        ROPMON_LOG_DEBUG("No ROP settings found for '{}'", job.out_node_path);
    } catch (const std::exception& e) {
        ROPMON_LOG_WARN("ROP metadata query failed, relying on the log: {}", e.what());
    }
    return std::nullopt;
}

bool RenderController::interrupt() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (starting_) {
        ROPMON_LOG_INFO("Interrupt requested while reading ROP settings, render will not start");
        start_canceled_ = true;
        return true;
    }
    if (!rendering_.load() || !process_) {
        return false;
    }

    if (flags_->canceling.load()) {
        ROPMON_LOG_INFO("Second interrupt request, escalating to kill");
        return kill_locked();
    }

    flags_->canceling = true;
    publish_text("\n Interrupt requested... Current frame will finish before stopping. \n\n",
                 text_color::ALERT, true, true);

    InterruptOutcome outcome = process_->interrupt();
    if (outcome == InterruptOutcome::Escalated) {
        flags_->killed = true;
    }
    return true;
}

bool RenderController::kill() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (starting_) {
        start_canceled_ = true;
        return true;
    }
    return kill_locked();
}

bool RenderController::kill_locked() {
    if (!rendering_.load() || !process_ || flags_->killed.load()) {
        return false;
    }

    flags_->killed = true;
    publish_text("\n Force kill requested... Stopping render immediately. \n\n",
                 text_color::ALERT, true, true);
    process_->kill();
    return true;
}

void RenderController::wait() {
    join_worker();
}

void RenderController::join_worker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void RenderController::publish_text(std::string text, const char* color, bool bold, bool center) {
    events_.push(render_event::TextOutput{std::move(text), color, bold, center});
}

} // namespace ropmon
