/*
 * File:        render_session.h
 * Module:      ropmon-core
 * Purpose:     Turns render log lines into frame state and notifications
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_RENDER_SESSION_H
#define ROPMON_CORE_RENDER_SESSION_H

#include "event_channel.h"
#include "frame_tracker.h"
#include "log_events.h"
#include "monitor_config.h"
#include "render_events.h"
#include "timing_estimator.h"

#include <chrono>
#include <optional>
#include <string>

namespace ropmon {

/// What the monitor loop needs to know about one processed line
struct LineOutcome {
    bool frame_ended = false;      ///< The ROP end-of-frame hook fired
    size_t events_recognized = 0;
};

/// Why a job stopped
struct JobEnd {
    std::optional<int> exit_code;
    bool killed = false;
};

/**
 * @brief Single-job state machine driven one log line at a time
 *
 * Owns the FrameTracker and TimingHistory for the job and publishes every
 * observable change on the channel. Time is always passed in, so the
 * session can be driven by a live process or by a captured log. It does
 * no I/O of its own and is used from one thread only. process_line() may
 * be overridden to observe the lines a monitor feeds in.
 */
class RenderSession {
public:
    using Clock = std::chrono::system_clock;

    RenderSession(std::optional<FrameRange> explicit_range,
                  const MonitorSettings& settings,
                  EventChannel<RenderEvent>& events);
    virtual ~RenderSession() = default;

    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    /// Start the clocks and publish the initial progress and time labels
    void begin(Clock::time_point now);

    /// Process one normalized log line
    virtual LineOutcome process_line(const std::string& line, Clock::time_point now);

    /// Frame range learned outside the log (ROP metadata); may precede begin()
    void announce_range(const FrameRange& range, FrameTotalSource source, Clock::time_point now);

    /**
     * @brief Periodic refresh of the time labels
     * @return True if the labels were published
     */
    bool tick(Clock::time_point now);

    /**
     * @brief Close the job
     *
     * Flushes any pending skip report, fails a frame that was still
     * rendering, publishes the final time labels with zero remaining and
     * then JobFinished. Only the first call has any effect.
     */
    void finish(Clock::time_point now, const JobEnd& end);

    bool finished() const { return finished_; }
    bool frame_in_progress() const { return tracker_.frame_in_progress(); }

    const FrameTracker& tracker() const { return tracker_; }
    const TimingHistory& history() const { return history_; }

    double elapsed_seconds(Clock::time_point now) const;

    /// Remaining-time estimate as the refresh timer would publish it
    RemainingEstimate current_estimate(Clock::time_point now) const;

private:
    void handle(const log_event::SavedFile& event, Clock::time_point now);
    void handle(const log_event::FrameRangeAnnounced& event, Clock::time_point now);
    void handle(const log_event::FrameStarted& event, Clock::time_point now);
    void handle(const log_event::FrameSkipped& event, Clock::time_point now);
    void handle(const log_event::FrameLoadingOptions& event, Clock::time_point now);
    void handle(const log_event::BlockProgress& event, Clock::time_point now);
    void handle(const log_event::FrameEnded& event, Clock::time_point now);
    void handle(const log_event::FrameCompleted& event, Clock::time_point now);
    void handle(const log_event::OutputFileAnnounced& event, Clock::time_point now);

    void publish_progress();
    void publish_times(const RemainingEstimate& estimate, Clock::time_point now);
    void publish_text(std::string text, const char* color = "", bool bold = false, bool center = false);
    void flush_skip_report(std::vector<int32_t> frames);

    EventChannel<RenderEvent>& events_;
    TimingHistory history_;
    TimingEstimator estimator_;
    FrameTracker tracker_;

    std::chrono::milliseconds refresh_interval_;
    Clock::time_point start_time_;
    Clock::time_point last_refresh_;
    bool began_ = false;
    bool finished_ = false;
    bool frame_ended_ = false;
};

} // namespace ropmon

#endif // ROPMON_CORE_RENDER_SESSION_H
