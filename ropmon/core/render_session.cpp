/*
 * File:        render_session.cpp
 * Module:      ropmon-core
 * Purpose:     Turns render log lines into frame state and notifications
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_session.h"
#include "log_event_extractor.h"
#include "logging.h"
#include "time_format.h"

#include <algorithm>
#include <utility>
#include <fmt/format.h>

namespace ropmon {

namespace {

double seconds_between(std::chrono::system_clock::time_point from, std::chrono::system_clock::time_point to) {
    return std::max(0.0, std::chrono::duration<double>(to - from).count());
}

std::chrono::system_clock::duration to_clock_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(seconds));
}

} // anonymous namespace

RenderSession::RenderSession(std::optional<FrameRange> explicit_range,
                             const MonitorSettings& settings,
                             EventChannel<RenderEvent>& events)
    : events_(events)
    , estimator_(history_, settings.min_seconds_per_frame_guess)
    , tracker_(std::move(explicit_range), &history_, settings.inference_margin)
    , refresh_interval_(std::max<int32_t>(1, settings.refresh_interval_ms))
{
}

void RenderSession::begin(Clock::time_point now) {
    start_time_ = now;
    last_refresh_ = now;
    began_ = true;

    // "0 / N" from the start, never "- / -"
    events_.push(render_event::ProgressChanged{0, std::max(1, tracker_.total_frames())});

    TimeSnapshot initial;
    initial.eta = now;
    events_.push(render_event::TimeLabels{initial});
}

LineOutcome RenderSession::process_line(const std::string& line, Clock::time_point now) {
    LineOutcome outcome;
    if (finished_) {
        return outcome;
    }
    if (!began_) {
        begin(now);
    }

    events_.push(render_event::RawLogLine{line});

    frame_ended_ = false;
    std::vector<LogEvent> recognized = extract_events(line);
    outcome.events_recognized = recognized.size();
    for (const auto& event : recognized) {
        std::visit([this, now](const auto& e) { handle(e, now); }, event);
    }
    outcome.frame_ended = frame_ended_;
    return outcome;
}

void RenderSession::announce_range(const FrameRange& range, FrameTotalSource source, Clock::time_point now) {
    if (!began_) {
        // Published by begin()
        tracker_.on_frame_range_announced(range.start, range.end, range.step, source);
        return;
    }
    if (tracker_.on_frame_range_announced(range.start, range.end, range.step, source)) {
        publish_progress();
        publish_times(current_estimate(now), now);
    }
}

bool RenderSession::tick(Clock::time_point now) {
    if (finished_ || !began_) {
        return false;
    }
    if (now - last_refresh_ < refresh_interval_) {
        return false;
    }
    publish_times(current_estimate(now), now);
    return true;
}

void RenderSession::finish(Clock::time_point now, const JobEnd& end) {
    if (finished_) {
        return;
    }
    if (!began_) {
        begin(now);
    }

    if (tracker_.has_pending_skips()) {
        flush_skip_report(tracker_.take_pending_skips());
    }

    if (auto failed = tracker_.fail_in_progress_frame()) {
        ROPMON_LOG_WARN("Frame {} did not finish rendering", *failed);
        events_.push(render_event::FrameFailed{*failed});
    }

    if (end.killed) {
        publish_text("\n Render Killed \n\n", text_color::ALERT, true, true);
    }

    events_.push(render_event::TimeLabels{estimator_.final_snapshot(elapsed_seconds(now), now)});
    events_.push(render_event::JobFinished{end.exit_code, end.killed});
    finished_ = true;

    ROPMON_LOG_INFO("Render finished: {} completed, {} skipped, elapsed {}",
                    tracker_.frames_completed(), tracker_.frames_skipped(),
                    format_duration(elapsed_seconds(now)));
}

double RenderSession::elapsed_seconds(Clock::time_point now) const {
    return seconds_between(start_time_, now);
}

RemainingEstimate RenderSession::current_estimate(Clock::time_point now) const {
    return estimator_.estimate_remaining(tracker_.frames_counted(), tracker_.total_frames(),
                                         elapsed_seconds(now));
}

// ---------------------------------------------------------------------------
// Event handlers

void RenderSession::handle(const log_event::SavedFile& event, Clock::time_point) {
    events_.push(render_event::ImageProduced{event.path});
}

void RenderSession::handle(const log_event::FrameRangeAnnounced& event, Clock::time_point now) {
    FrameTotalSource source = event.origin == log_event::RangeOrigin::RopMetadata
        ? FrameTotalSource::FromRopMetadata
        : FrameTotalSource::FromLogEcho;
    announce_range(FrameRange{event.start, event.end, event.step.value_or(1)}, source, now);
}

void RenderSession::handle(const log_event::FrameStarted& event, Clock::time_point now) {
    if (tracker_.on_frame_started(event.frame, now)) {
        publish_progress();
    }
}

void RenderSession::handle(const log_event::FrameSkipped&, Clock::time_point now) {
    auto frame = tracker_.current_frame();
    if (!frame) {
        ROPMON_LOG_DEBUG("Skip reported with no frame in progress");
        return;
    }
    if (!tracker_.on_frame_skipped(*frame)) {
        return;
    }

    events_.push(render_event::FrameWasSkipped{*frame});
    publish_progress();
    if (tracker_.total_frames() > 0) {
        publish_times(current_estimate(now), now);
    }
}

void RenderSession::handle(const log_event::FrameLoadingOptions&, Clock::time_point now) {
    auto frame = tracker_.current_frame();
    if (!frame) {
        return;
    }

    FramePromotion promotion = tracker_.on_frame_loading_options(*frame, now);
    if (!promotion.promoted) {
        return;
    }

    if (!promotion.flushed_skips.empty()) {
        flush_skip_report(std::move(promotion.flushed_skips));
    }

    std::optional<double> estimate;
    if (!history_.empty()) {
        double seconds = history_.size() >= 2 ? history_.recent_estimate() : history_.average();
        if (seconds > 0.0) {
            estimate = seconds;
        }
    }

    const FrameRecord* record = tracker_.find(*frame);
    Clock::time_point started_at = record && record->started_at ? *record->started_at : now;

    events_.push(render_event::FrameHeader{*frame, started_at, estimate});

    publish_text(fmt::format("\n Frame {}\n", *frame), text_color::FRAME_HEADER, true);
    std::string info = fmt::format("   {:<8} {}\n", "Started", format_clock(started_at));
    if (estimate) {
        info += fmt::format("   {:<8} {} - {}\n", "Estimate",
                            format_clock(started_at + to_clock_duration(*estimate)),
                            format_duration_compact(*estimate));
    }
    publish_text(std::move(info));

    publish_progress();
}

void RenderSession::handle(const log_event::BlockProgress& event, Clock::time_point now) {
    auto frame = tracker_.current_frame();
    if (!frame) {
        return;
    }

    auto percent = tracker_.on_block_progress(*frame, event.block, event.total);
    if (!percent) {
        return;
    }
    events_.push(render_event::FrameProgressChanged{*frame, *percent});

    if (tracker_.total_frames() <= 0) {
        return;
    }

    const FrameRecord* record = tracker_.find(*frame);
    double frame_elapsed = 0.0;
    if (record && record->rendering_at) {
        frame_elapsed = seconds_between(*record->rendering_at, now);
    } else if (record && record->started_at) {
        frame_elapsed = seconds_between(*record->started_at, now);
    }

    RemainingEstimate estimate = estimator_.estimate_remaining_in_frame(
        tracker_.frames_counted(), tracker_.total_frames(), elapsed_seconds(now),
        *percent / 100.0, frame_elapsed);
    publish_times(estimate, now);
}

void RenderSession::handle(const log_event::FrameEnded&, Clock::time_point) {
    tracker_.on_frame_ended();
    frame_ended_ = true;
}

void RenderSession::handle(const log_event::FrameCompleted& event, Clock::time_point now) {
    int32_t frame = tracker_.frame_for_completion();
    CompletionOutcome outcome = tracker_.on_frame_completed(frame, event.seconds);
    if (outcome == CompletionOutcome::Duplicate) {
        ROPMON_LOG_DEBUG("Ignoring repeated completion of frame {}", frame);
        return;
    }
    if (outcome == CompletionOutcome::RecordedWithoutStart) {
        ROPMON_LOG_DEBUG("Frame {} completed without a start line; recorded anyway", frame);
        if (tracker_.has_pending_skips()) {
            flush_skip_report(tracker_.take_pending_skips());
        }
    }

    const FrameRecord* record = tracker_.find(frame);
    double duration = record ? record->duration_seconds : event.seconds;

    publish_progress();
    events_.push(render_event::FrameFinished{frame, duration});
    publish_times(current_estimate(now), now);
    publish_text(fmt::format("   {:<8} {} - {}\n\n", "Finished", format_clock(now),
                             format_duration_compact(duration)));
}

void RenderSession::handle(const log_event::OutputFileAnnounced& event, Clock::time_point) {
    events_.push(render_event::ImageProduced{event.path});
}

// ---------------------------------------------------------------------------
// Publishing

void RenderSession::publish_progress() {
    events_.push(render_event::ProgressChanged{tracker_.frames_counted(), tracker_.total_frames()});
}

void RenderSession::publish_times(const RemainingEstimate& estimate, Clock::time_point now) {
    TimeSnapshot snapshot = estimator_.snapshot(estimate, tracker_.total_frames(), elapsed_seconds(now), now);
    events_.push(render_event::TimeLabels{snapshot});
    last_refresh_ = now;
}

void RenderSession::publish_text(std::string text, const char* color, bool bold, bool center) {
    events_.push(render_event::TextOutput{std::move(text), color, bold, center});
}

void RenderSession::flush_skip_report(std::vector<int32_t> frames) {
    publish_text(format_skip_report(frames, tracker_.frame_step()) + "\n\n");
}

} // namespace ropmon
