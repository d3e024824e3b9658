/*
 * File:        frame_tracker.h
 * Module:      ropmon-core
 * Purpose:     Per-frame render state and frame-total discovery
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_FRAME_TRACKER_H
#define ROPMON_CORE_FRAME_TRACKER_H

#include "render_job.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ropmon {

class TimingHistory;

enum class FrameStatus {
    Pending,
    Rendering,
    Completed,
    Skipped,
    Failed
};

const char* frame_status_name(FrameStatus status);

/**
 * @brief State of one frame number of the active job
 *
 * Created the first time the frame is seen in the log and updated in place.
 */
struct FrameRecord {
    int32_t frame_number = 0;
    int32_t sequence_index = -1;
    FrameStatus status = FrameStatus::Pending;
    int32_t progress_percent = 0;       ///< Meaningful while Rendering
    double duration_seconds = 0.0;      ///< Set when Completed (0 when Skipped)
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> rendering_at;
};

enum class FrameTotalSource {
    Unset,
    FromExplicitArgs,
    FromLogEcho,
    FromRopMetadata,
    FromInference
};

const char* frame_total_source_name(FrameTotalSource source);

struct FrameTotalDiscovery {
    int32_t total_frames = 0;
    FrameTotalSource source = FrameTotalSource::Unset;
};

enum class CompletionOutcome {
    Recorded,
    RecordedWithoutStart,
    Duplicate
};

/// Result of on_frame_loading_options()
struct FramePromotion {
    bool promoted = false;
    std::vector<int32_t> flushed_skips;   ///< Skip run that ended with this frame
};

/**
 * @brief Frame-lifecycle state machine for one render job
 *
 * Total-frame precedence: an explicit range fixes the total and the
 * sequence mapping for the life of the job. Otherwise the first
 * range-derived source (log echo or ROP metadata) replaces any inferred
 * total and later range announcements may only raise it. Inference only
 * ever raises an unset or inferred total.
 *
 * Not thread-safe: owned by the monitor thread.
 */
class FrameTracker {
public:
    /**
     * @param explicit_range Range given on the command line, if any
     * @param history Completed durations are appended here (may be null)
     * @param inference_margin Added to a frame number when inferring the total
     */
    FrameTracker(std::optional<FrameRange> explicit_range, TimingHistory* history,
                 int32_t inference_margin = 5);

    /// @return True if total_frames changed
    bool on_frame_range_announced(int32_t start, int32_t end, int32_t step, FrameTotalSource source);

    /**
     * @brief A frame is about to be processed (it may still be skipped)
     *
     * A frame that already completed or was skipped starts a new pass, as
     * happens when several ROPs of a merge node render the same frames. It
     * stays counted once.
     * @return True if total_frames was raised by inference
     */
    bool on_frame_started(int32_t frame_number, std::chrono::system_clock::time_point now);

    /// @return False if the frame was already skipped or completed
    bool on_frame_skipped(int32_t frame_number);

    /// The frame really renders: promote it and flush the pending skip run
    FramePromotion on_frame_loading_options(int32_t frame_number, std::chrono::system_clock::time_point now);

    /**
     * @brief Record a "Block k/n" report for the frame
     * @return New progress percent, or nullopt if the report was ignored
     */
    std::optional<int32_t> on_block_progress(int32_t frame_number, int32_t block, int32_t total_blocks);

    /// End-of-frame hook fired; the frame is no longer in flight
    void on_frame_ended();

    /**
     * @brief Frame finished rendering
     *
     * Recorded even when no start was observed for the frame, since single
     * log lines can go missing. A second completion of the same frame is
     * ignored.
     */
    CompletionOutcome on_frame_completed(int32_t frame_number, double duration_seconds);

    /// Mark a frame still in flight as Failed (job killed or crashed)
    std::optional<int32_t> fail_in_progress_frame();

    /// Skip run collected since the last real render; clears it
    std::vector<int32_t> take_pending_skips();

    /**
     * @brief Frame a completion line belongs to
     *
     * The current frame while it is unfinished; otherwise the frame after
     * the last one seen (or the range start before anything was seen).
     */
    int32_t frame_for_completion() const;

    /// Step of the known frame grid (1 when no range is known)
    int32_t frame_step() const { return range_ ? range_->step : 1; }

    // Accessors
    const FrameTotalDiscovery& discovery() const { return discovery_; }
    int32_t total_frames() const { return discovery_.total_frames; }
    int32_t frames_counted() const { return static_cast<int32_t>(counted_.size()); }
    int32_t frames_completed() const { return completed_count_; }
    int32_t frames_skipped() const { return skipped_count_; }
    std::optional<int32_t> current_frame() const { return current_frame_; }
    bool frame_in_progress() const { return frame_in_progress_; }
    bool has_pending_skips() const { return !pending_skips_.empty(); }

    const FrameRecord* find(int32_t frame_number) const;
    const std::map<int32_t, FrameRecord>& records() const { return records_; }

    /// Sequence index of a frame, or -1 if never seen
    int32_t sequence_index(int32_t frame_number) const;

private:
    FrameRecord& get_or_create(int32_t frame_number);
    int32_t assign_index(int32_t frame_number);
    void reindex();
    void reset_blocks();

    std::optional<FrameRange> range_;     ///< Explicit or range-derived
    FrameTotalDiscovery discovery_;
    TimingHistory* history_;
    int32_t inference_margin_;

    std::map<int32_t, FrameRecord> records_;
    std::set<int32_t> counted_;
    std::vector<int32_t> pending_skips_;
    int32_t completed_count_ = 0;
    int32_t skipped_count_ = 0;
    int32_t next_free_index_ = 0;
    std::vector<int32_t> sighting_order_;

    std::optional<int32_t> current_frame_;
    bool frame_in_progress_ = false;

    // Distinct blocks reported for the frame in flight
    std::set<int32_t> completed_blocks_;
    int32_t block_total_ = 0;
};

/**
 * @brief Compress frame numbers into ranges: {5,6,7,9} -> "5-7, 9"
 *
 * Frames are consecutive when they differ by step.
 */
std::string compress_frame_ranges(std::vector<int32_t> frames, int32_t step = 1);

/// "Frames 5-7 skipped - Files already exist" (singular for one frame)
std::string format_skip_report(const std::vector<int32_t>& frames, int32_t step = 1);

} // namespace ropmon

#endif // ROPMON_CORE_FRAME_TRACKER_H
