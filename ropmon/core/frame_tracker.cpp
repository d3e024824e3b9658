/*
 * File:        frame_tracker.cpp
 * Module:      ropmon-core
 * Purpose:     Per-frame render state and frame-total discovery
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "frame_tracker.h"
#include "timing_estimator.h"
#include "logging.h"

#include <algorithm>
#include <fmt/format.h>

namespace ropmon {

const char* frame_status_name(FrameStatus status) {
    switch (status) {
        case FrameStatus::Pending:   return "pending";
        case FrameStatus::Rendering: return "rendering";
        case FrameStatus::Completed: return "completed";
        case FrameStatus::Skipped:   return "skipped";
        case FrameStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* frame_total_source_name(FrameTotalSource source) {
    switch (source) {
        case FrameTotalSource::Unset:            return "unset";
        case FrameTotalSource::FromExplicitArgs: return "explicit-args";
        case FrameTotalSource::FromLogEcho:      return "log-echo";
        case FrameTotalSource::FromRopMetadata:  return "rop-metadata";
        case FrameTotalSource::FromInference:    return "inference";
    }
    return "unknown";
}

namespace {

bool is_range_derived(FrameTotalSource source) {
    return source == FrameTotalSource::FromLogEcho || source == FrameTotalSource::FromRopMetadata;
}

} // anonymous namespace

FrameTracker::FrameTracker(std::optional<FrameRange> explicit_range, TimingHistory* history,
                           int32_t inference_margin)
    : history_(history)
    , inference_margin_(std::max<int32_t>(0, inference_margin))
{
    if (explicit_range && explicit_range->count() > 0) {
        range_ = explicit_range;
        discovery_.total_frames = explicit_range->count();
        discovery_.source = FrameTotalSource::FromExplicitArgs;
        next_free_index_ = discovery_.total_frames;
    }
}

bool FrameTracker::on_frame_range_announced(int32_t start, int32_t end, int32_t step, FrameTotalSource source) {
    if (discovery_.source == FrameTotalSource::FromExplicitArgs) {
        ROPMON_LOG_DEBUG("Ignoring {} frame range {}-{}: explicit range is authoritative",
                         frame_total_source_name(source), start, end);
        return false;
    }

    FrameRange announced{start, end, step > 0 ? step : 1};
    int32_t count = announced.count();
    if (count <= 0) {
        return false;
    }

    int32_t old_total = discovery_.total_frames;

    if (source == FrameTotalSource::FromExplicitArgs) {
        // Explicit range arriving late replaces everything and is final
        range_ = announced;
        discovery_.total_frames = count;
        discovery_.source = source;
        reindex();
        return discovery_.total_frames != old_total;
    }

    if (is_range_derived(discovery_.source)) {
        // A range-derived total is already in place: it may only grow
        if (count > discovery_.total_frames) {
            discovery_.total_frames = count;
            ROPMON_LOG_DEBUG("Frame total raised to {} by {} range {}-{}", count,
                             frame_total_source_name(source), start, end);
        }
        return discovery_.total_frames != old_total;
    }

    // First range-derived source replaces inference, but never drops below
    // what has actually been seen
    range_ = announced;
    discovery_.total_frames = std::max(count, frames_counted());
    discovery_.source = source;
    reindex();

    ROPMON_LOG_DEBUG("Frame total {} from {} range {}-{} step {}", discovery_.total_frames,
                     frame_total_source_name(source), start, end, announced.step);
    return discovery_.total_frames != old_total;
}

bool FrameTracker::on_frame_started(int32_t frame_number, std::chrono::system_clock::time_point now) {
    FrameRecord& record = get_or_create(frame_number);
    if (record.status != FrameStatus::Pending && record.status != FrameStatus::Rendering) {
        // Same frame number again (e.g. the next ROP of a merge node): new pass
        ROPMON_LOG_DEBUG("Frame {} started again after it was {}", frame_number,
                         frame_status_name(record.status));
        record.status = FrameStatus::Pending;
        record.progress_percent = 0;
        record.duration_seconds = 0.0;
        record.rendering_at.reset();
        reset_blocks();
    }
    record.started_at = now;

    if (current_frame_ != frame_number) {
        reset_blocks();
    }
    current_frame_ = frame_number;

    bool may_infer = discovery_.source == FrameTotalSource::Unset
        || discovery_.source == FrameTotalSource::FromInference;
    if (!may_infer || discovery_.total_frames > frame_number) {
        return false;
    }

    int32_t inferred = std::max(frame_number + inference_margin_, discovery_.total_frames);
    if (inferred == discovery_.total_frames) {
        return false;
    }
    discovery_.total_frames = inferred;
    discovery_.source = FrameTotalSource::FromInference;
    ROPMON_LOG_DEBUG("Frame total inferred as {} from frame {}", inferred, frame_number);
    return true;
}

bool FrameTracker::on_frame_skipped(int32_t frame_number) {
    FrameRecord& record = get_or_create(frame_number);
    if (record.status == FrameStatus::Skipped || record.status == FrameStatus::Completed) {
        return false;
    }

    record.status = FrameStatus::Skipped;
    record.duration_seconds = 0.0;
    record.progress_percent = 0;

    counted_.insert(frame_number);
    pending_skips_.push_back(frame_number);
    ++skipped_count_;

    // The renderer moves straight on to the next frame
    frame_in_progress_ = false;
    current_frame_.reset();
    reset_blocks();
    return true;
}

FramePromotion FrameTracker::on_frame_loading_options(int32_t frame_number,
                                                      std::chrono::system_clock::time_point now) {
    FramePromotion promotion;
    FrameRecord& record = get_or_create(frame_number);
    if (record.status == FrameStatus::Skipped || record.status == FrameStatus::Completed
        || record.status == FrameStatus::Rendering) {
        return promotion;
    }

    record.status = FrameStatus::Rendering;
    record.progress_percent = 0;
    record.rendering_at = now;
    if (!record.started_at) {
        record.started_at = now;
    }

    counted_.insert(frame_number);
    frame_in_progress_ = true;
    current_frame_ = frame_number;

    promotion.promoted = true;
    promotion.flushed_skips = take_pending_skips();
    return promotion;
}

std::optional<int32_t> FrameTracker::on_block_progress(int32_t frame_number, int32_t block, int32_t total_blocks) {
    if (total_blocks <= 0 || !current_frame_ || *current_frame_ != frame_number) {
        return std::nullopt;
    }

    if (total_blocks != block_total_) {
        // Different bucket layout: a new pass over the frame
        completed_blocks_.clear();
        block_total_ = total_blocks;
    }
    completed_blocks_.insert(block);

    int32_t distinct = static_cast<int32_t>(completed_blocks_.size());
    int32_t percent = std::min(100, distinct * 100 / total_blocks);

    FrameRecord& record = get_or_create(frame_number);
    record.progress_percent = percent;
    return percent;
}

void FrameTracker::on_frame_ended() {
    frame_in_progress_ = false;
}

CompletionOutcome FrameTracker::on_frame_completed(int32_t frame_number, double duration_seconds) {
    FrameRecord& record = get_or_create(frame_number);
    if (record.status == FrameStatus::Completed) {
        return CompletionOutcome::Duplicate;
    }

    bool had_start = record.started_at.has_value();

    record.status = FrameStatus::Completed;
    record.duration_seconds = std::max(0.0, duration_seconds);
    record.progress_percent = 100;

    counted_.insert(frame_number);
    ++completed_count_;
    if (history_) {
        history_->add(record.duration_seconds);
    }
    current_frame_ = frame_number;
    reset_blocks();

    return had_start ? CompletionOutcome::Recorded : CompletionOutcome::RecordedWithoutStart;
}

std::optional<int32_t> FrameTracker::fail_in_progress_frame() {
    if (!current_frame_) {
        return std::nullopt;
    }
    auto it = records_.find(*current_frame_);
    if (it == records_.end() || it->second.status != FrameStatus::Rendering) {
        return std::nullopt;
    }
    it->second.status = FrameStatus::Failed;
    frame_in_progress_ = false;
    return it->first;
}

std::vector<int32_t> FrameTracker::take_pending_skips() {
    std::vector<int32_t> skips;
    skips.swap(pending_skips_);
    return skips;
}

int32_t FrameTracker::frame_for_completion() const {
    if (current_frame_) {
        const FrameRecord* current = find(*current_frame_);
        if (current && current->status != FrameStatus::Completed && current->status != FrameStatus::Skipped) {
            return *current_frame_;
        }
    }
    if (!sighting_order_.empty()) {
        return sighting_order_.back() + frame_step();
    }
    return range_ ? range_->start : 1;
}

const FrameRecord* FrameTracker::find(int32_t frame_number) const {
    auto it = records_.find(frame_number);
    return it == records_.end() ? nullptr : &it->second;
}

int32_t FrameTracker::sequence_index(int32_t frame_number) const {
    const FrameRecord* record = find(frame_number);
    if (record) {
        return record->sequence_index;
    }
    if (range_ && discovery_.source == FrameTotalSource::FromExplicitArgs) {
        return range_->index_of(frame_number);
    }
    return -1;
}

FrameRecord& FrameTracker::get_or_create(int32_t frame_number) {
    auto it = records_.find(frame_number);
    if (it != records_.end()) {
        return it->second;
    }

    FrameRecord record;
    record.frame_number = frame_number;
    record.sequence_index = assign_index(frame_number);
    sighting_order_.push_back(frame_number);
    return records_.emplace(frame_number, record).first->second;
}

int32_t FrameTracker::assign_index(int32_t frame_number) {
    if (range_ && range_->contains(frame_number)) {
        return range_->index_of(frame_number);
    }
    return next_free_index_++;
}

void FrameTracker::reindex() {
    // Frames on the range grid take their range position; anything outside
    // the range follows it in first-sighting order
    next_free_index_ = range_ ? range_->count() : 0;
    for (int32_t frame : sighting_order_) {
        FrameRecord& record = records_[frame];
        record.sequence_index = assign_index(frame);
    }
}

void FrameTracker::reset_blocks() {
    completed_blocks_.clear();
    block_total_ = 0;
}

std::string compress_frame_ranges(std::vector<int32_t> frames, int32_t step) {
    if (frames.empty()) {
        return std::string();
    }
    if (step <= 0) {
        step = 1;
    }

    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());

    std::string result;
    auto append_run = [&result](int32_t first, int32_t last) {
        if (!result.empty()) {
            result += ", ";
        }
        result += first == last ? fmt::format("{}", first) : fmt::format("{}-{}", first, last);
    };

    int32_t run_start = frames.front();
    int32_t run_end = frames.front();
    for (size_t i = 1; i < frames.size(); ++i) {
        if (frames[i] == run_end + step) {
            run_end = frames[i];
        } else {
            append_run(run_start, run_end);
            run_start = run_end = frames[i];
        }
    }
    append_run(run_start, run_end);
    return result;
}

std::string format_skip_report(const std::vector<int32_t>& frames, int32_t step) {
    if (frames.empty()) {
        return std::string();
    }
    std::string ranges = compress_frame_ranges(frames, step);
    if (frames.size() == 1) {
        return fmt::format("Frame {} skipped - File already exists", ranges);
    }
    return fmt::format("Frames {} skipped - Files already exist", ranges);
}

} // namespace ropmon
