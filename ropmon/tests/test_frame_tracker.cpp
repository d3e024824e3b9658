/*
 * File:        test_frame_tracker.cpp
 * Module:      ropmon-tests
 * Purpose:     Frame tracker test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "frame_tracker.h"
#include "timing_estimator.h"
#include <cassert>
#include <iostream>

using namespace ropmon;

static const auto T0 = std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50));

void test_explicit_range_is_authoritative() {
    TimingHistory history;
    FrameTracker tracker(FrameRange{1, 10, 1}, &history);

    assert(tracker.total_frames() == 10);
    assert(tracker.discovery().source == FrameTotalSource::FromExplicitArgs);

    // No log-derived source may change it
    assert(!tracker.on_frame_range_announced(1, 100, 1, FrameTotalSource::FromLogEcho));
    assert(!tracker.on_frame_range_announced(1, 200, 1, FrameTotalSource::FromRopMetadata));
    assert(!tracker.on_frame_started(50, T0));
    assert(tracker.total_frames() == 10);
    assert(tracker.discovery().source == FrameTotalSource::FromExplicitArgs);

    std::cout << "test_explicit_range_is_authoritative: PASSED\n";
}

void test_stepped_sequence_index() {
    FrameTracker tracker(FrameRange{10, 30, 5}, nullptr);
    assert(tracker.total_frames() == 5);

    // Index is (N - start) / step, regardless of the order frames appear
    tracker.on_frame_started(25, T0);
    tracker.on_frame_started(10, T0);
    tracker.on_frame_started(20, T0);
    assert(tracker.sequence_index(25) == 3);
    assert(tracker.sequence_index(10) == 0);
    assert(tracker.sequence_index(20) == 2);
    assert(tracker.sequence_index(30) == 4);   // not seen yet, still mapped
    assert(tracker.sequence_index(12) == -1);  // off the step grid

    std::cout << "test_stepped_sequence_index: PASSED\n";
}

void test_first_sighting_index_and_inference() {
    FrameTracker tracker(std::nullopt, nullptr, 5);
    assert(tracker.total_frames() == 0);
    assert(tracker.discovery().source == FrameTotalSource::Unset);

    assert(tracker.on_frame_started(40, T0));
    assert(tracker.total_frames() == 45);
    assert(tracker.discovery().source == FrameTotalSource::FromInference);

    // Inference only raises
    assert(!tracker.on_frame_started(3, T0));
    assert(tracker.total_frames() == 45);

    assert(tracker.sequence_index(40) == 0);
    assert(tracker.sequence_index(3) == 1);

    std::cout << "test_first_sighting_index_and_inference: PASSED\n";
}

void test_range_derived_replaces_inference() {
    FrameTracker tracker(std::nullopt, nullptr, 5);
    tracker.on_frame_started(12, T0);
    tracker.on_frame_loading_options(12, T0);
    assert(tracker.total_frames() == 17);

    // Scenario: the log echoes "-s 10 -e 19"
    assert(tracker.on_frame_range_announced(10, 19, 1, FrameTotalSource::FromLogEcho));
    assert(tracker.total_frames() == 10);
    assert(tracker.discovery().source == FrameTotalSource::FromLogEcho);
    // Re-indexed onto the range
    assert(tracker.sequence_index(12) == 2);

    // A later range-derived source may only raise it
    assert(!tracker.on_frame_range_announced(10, 14, 1, FrameTotalSource::FromRopMetadata));
    assert(tracker.total_frames() == 10);
    assert(tracker.on_frame_range_announced(10, 29, 1, FrameTotalSource::FromRopMetadata));
    assert(tracker.total_frames() == 20);
    assert(tracker.discovery().source == FrameTotalSource::FromLogEcho);

    // Inference no longer applies
    assert(!tracker.on_frame_started(90, T0));
    assert(tracker.total_frames() == 20);

    std::cout << "test_range_derived_replaces_inference: PASSED\n";
}

void test_skip_flow() {
    FrameTracker tracker(FrameRange{1, 10, 1}, nullptr);
    tracker.on_frame_started(5, T0);
    assert(tracker.current_frame() == 5);

    assert(tracker.on_frame_skipped(5));
    const FrameRecord* record = tracker.find(5);
    assert(record);
    assert(record->status == FrameStatus::Skipped);
    assert(record->duration_seconds == 0.0);
    assert(tracker.frames_counted() == 1);
    assert(tracker.frames_skipped() == 1);
    assert(!tracker.current_frame());

    // Skipping twice changes nothing
    assert(!tracker.on_frame_skipped(5));
    assert(tracker.frames_counted() == 1);

    // A skipped frame never gets promoted
    FramePromotion promotion = tracker.on_frame_loading_options(5, T0);
    assert(!promotion.promoted);

    std::cout << "test_skip_flow: PASSED\n";
}

void test_skip_run_flushed_on_promotion() {
    FrameTracker tracker(FrameRange{1, 10, 1}, nullptr);
    for (int32_t frame = 5; frame <= 7; ++frame) {
        tracker.on_frame_started(frame, T0);
        tracker.on_frame_skipped(frame);
    }
    assert(tracker.has_pending_skips());

    tracker.on_frame_started(8, T0);
    FramePromotion promotion = tracker.on_frame_loading_options(8, T0);
    assert(promotion.promoted);
    assert((promotion.flushed_skips == std::vector<int32_t>{5, 6, 7}));
    assert(!tracker.has_pending_skips());
    assert(tracker.frame_in_progress());
    assert(tracker.find(8)->status == FrameStatus::Rendering);

    // Flushed exactly once
    tracker.on_frame_completed(8, 3.0);
    tracker.on_frame_started(9, T0);
    assert(tracker.on_frame_loading_options(9, T0).flushed_skips.empty());

    std::cout << "test_skip_run_flushed_on_promotion: PASSED\n";
}

void test_block_progress_set_semantics() {
    FrameTracker tracker(FrameRange{1, 2, 1}, nullptr);
    tracker.on_frame_started(1, T0);
    tracker.on_frame_loading_options(1, T0);

    assert(tracker.on_block_progress(1, 1, 4) == 25);
    assert(tracker.on_block_progress(1, 2, 4) == 50);
    assert(tracker.on_block_progress(1, 1, 4) == 50);   // duplicate
    assert(tracker.on_block_progress(1, 3, 4) == 75);
    assert(tracker.on_block_progress(1, 3, 4) == 75);
    assert(tracker.on_block_progress(1, 4, 4) == 100);

    // Out of order from the start
    FrameTracker other(std::nullopt, nullptr);
    other.on_frame_started(7, T0);
    assert(other.on_block_progress(7, 3, 10) == 10);
    assert(other.on_block_progress(7, 3, 10) == 10);
    assert(other.on_block_progress(7, 2, 10) == 20);

    // Reports for a frame that is not current are ignored
    assert(!other.on_block_progress(8, 1, 10));
    assert(!other.on_block_progress(7, 1, 0));

    std::cout << "test_block_progress_set_semantics: PASSED\n";
}

void test_blocks_reset_per_frame() {
    FrameTracker tracker(FrameRange{1, 2, 1}, nullptr);
    tracker.on_frame_started(1, T0);
    tracker.on_frame_loading_options(1, T0);
    tracker.on_block_progress(1, 1, 2);
    tracker.on_block_progress(1, 2, 2);
    tracker.on_frame_completed(1, 2.0);

    tracker.on_frame_started(2, T0);
    tracker.on_frame_loading_options(2, T0);
    assert(tracker.on_block_progress(2, 1, 2) == 50);

    std::cout << "test_blocks_reset_per_frame: PASSED\n";
}

void test_completion_records_history() {
    TimingHistory history;
    FrameTracker tracker(FrameRange{1, 3, 1}, &history);

    tracker.on_frame_started(1, T0);
    tracker.on_frame_loading_options(1, T0);
    assert(tracker.on_frame_completed(1, 10.0) == CompletionOutcome::Recorded);
    assert(tracker.find(1)->status == FrameStatus::Completed);
    assert(tracker.find(1)->duration_seconds == 10.0);
    assert(history.size() == 1);
    assert(tracker.frames_completed() == 1);

    // Repeated completion line
    assert(tracker.on_frame_completed(1, 10.0) == CompletionOutcome::Duplicate);
    assert(history.size() == 1);

    std::cout << "test_completion_records_history: PASSED\n";
}

void test_completion_without_start() {
    TimingHistory history;
    FrameTracker tracker(FrameRange{1, 5, 2}, &history);

    // Nothing seen yet: belongs to the range start
    assert(tracker.frame_for_completion() == 1);
    assert(tracker.on_frame_completed(1, 4.0) == CompletionOutcome::RecordedWithoutStart);
    assert(history.size() == 1);

    // Next completion without a start line goes to the next frame on the grid
    assert(tracker.frame_for_completion() == 3);
    assert(tracker.on_frame_completed(3, 5.0) == CompletionOutcome::RecordedWithoutStart);
    assert(tracker.find(3)->status == FrameStatus::Completed);
    assert(tracker.sequence_index(3) == 1);
    assert(tracker.frames_counted() == 2);

    std::cout << "test_completion_without_start: PASSED\n";
}

void test_frame_rendered_again() {
    TimingHistory history;
    FrameTracker tracker(FrameRange{1, 2, 1}, &history);

    tracker.on_frame_started(1, T0);
    tracker.on_frame_loading_options(1, T0);
    tracker.on_block_progress(1, 1, 2);
    tracker.on_frame_ended();
    assert(tracker.on_frame_completed(1, 10.0) == CompletionOutcome::Recorded);

    // Second ROP renders frame 1 as well
    tracker.on_frame_started(1, T0 + std::chrono::seconds(10));
    assert(tracker.find(1)->status == FrameStatus::Pending);
    assert(tracker.find(1)->progress_percent == 0);
    assert(tracker.frame_for_completion() == 1);

    FramePromotion promotion = tracker.on_frame_loading_options(1, T0 + std::chrono::seconds(11));
    assert(promotion.promoted);
    assert(tracker.frame_in_progress());
    assert(tracker.find(1)->status == FrameStatus::Rendering);
    assert(tracker.on_block_progress(1, 1, 2) == 50);

    tracker.on_frame_ended();
    assert(tracker.on_frame_completed(1, 12.0) == CompletionOutcome::Recorded);
    assert(tracker.find(1)->duration_seconds == 12.0);
    assert(history.size() == 2);
    assert(tracker.frames_completed() == 2);
    // Counted once, never more than the total
    assert(tracker.frames_counted() == 1);
    assert(tracker.find(2) == nullptr);

    // A skipped frame can be skipped again by the next ROP
    tracker.on_frame_started(2, T0);
    assert(tracker.on_frame_skipped(2));
    tracker.on_frame_started(2, T0);
    assert(tracker.on_frame_skipped(2));
    assert(tracker.frames_counted() == 2);

    std::cout << "test_frame_rendered_again: PASSED\n";
}

void test_fail_in_progress() {
    FrameTracker tracker(std::nullopt, nullptr);
    tracker.on_frame_started(3, T0);
    // Started but not rendering: nothing to fail
    assert(!tracker.fail_in_progress_frame());

    tracker.on_frame_loading_options(3, T0);
    auto failed = tracker.fail_in_progress_frame();
    assert(failed && *failed == 3);
    assert(tracker.find(3)->status == FrameStatus::Failed);
    assert(!tracker.frame_in_progress());

    std::cout << "test_fail_in_progress: PASSED\n";
}

void test_sequence_indices_contiguous() {
    FrameTracker tracker(FrameRange{1, 9, 2}, nullptr);
    for (int32_t frame : FrameRange{1, 9, 2}.frames()) {
        tracker.on_frame_started(frame, T0);
        tracker.on_frame_loading_options(frame, T0);
        tracker.on_frame_completed(frame, 1.0);
    }

    std::vector<bool> used(static_cast<size_t>(tracker.total_frames()), false);
    for (const auto& entry : tracker.records()) {
        int32_t index = entry.second.sequence_index;
        assert(index >= 0 && index < tracker.total_frames());
        assert(!used[static_cast<size_t>(index)]);
        used[static_cast<size_t>(index)] = true;
    }
    for (bool u : used) {
        assert(u);
    }

    std::cout << "test_sequence_indices_contiguous: PASSED\n";
}

void test_compress_frame_ranges() {
    assert(compress_frame_ranges({}) == "");
    assert(compress_frame_ranges({5}) == "5");
    assert(compress_frame_ranges({5, 6, 7}) == "5-7");
    assert(compress_frame_ranges({9, 5, 7, 6}) == "5-7, 9");
    assert(compress_frame_ranges({1, 3, 5, 9}, 2) == "1-5, 9");
    assert(compress_frame_ranges({1, 1, 2}) == "1-2");

    assert(format_skip_report({5, 6, 7}) == "Frames 5-7 skipped - Files already exist");
    assert(format_skip_report({5}) == "Frame 5 skipped - File already exists");
    assert(format_skip_report({2, 4}) == "Frames 2, 4 skipped - Files already exist");
    assert(format_skip_report({}) == "");

    std::cout << "test_compress_frame_ranges: PASSED\n";
}

int main() {
    std::cout << "Running frame tracker tests...\n";

    test_explicit_range_is_authoritative();
    test_stepped_sequence_index();
    test_first_sighting_index_and_inference();
    test_range_derived_replaces_inference();
    test_skip_flow();
    test_skip_run_flushed_on_promotion();
    test_block_progress_set_semantics();
    test_blocks_reset_per_frame();
    test_completion_records_history();
    test_completion_without_start();
    test_frame_rendered_again();
    test_fail_in_progress();
    test_sequence_indices_contiguous();
    test_compress_frame_ranges();

    std::cout << "All frame tracker tests passed!\n";
    return 0;
}
