/*
 * File:        test_log_event_extractor.cpp
 * Module:      ropmon-tests
 * Purpose:     Log pattern recognizer test suite
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "log_event_extractor.h"
#include <cassert>
#include <iostream>

using namespace ropmon;

template <typename T>
static const T* event_at(const std::vector<LogEvent>& events, size_t index) {
    if (index >= events.size()) {
        return nullptr;
    }
    return std::get_if<T>(&events[index]);
}

void test_saved_file() {
    auto quoted = match_saved_file("Saved file '/renders/shot010/beauty.0005.exr' in 0.4s");
    assert(quoted);
    assert(quoted->path == "/renders/shot010/beauty.0005.exr");

    auto double_quoted = match_saved_file("Saved file \"C:/render/out.0001.PNG\"");
    assert(double_quoted);
    assert(double_quoted->path == "C:/render/out.0001.PNG");

    auto bare = match_saved_file("Saved file /tmp/frame.0001.tif");
    assert(bare);
    assert(bare->path == "/tmp/frame.0001.tif");

    // Not an image
    assert(!match_saved_file("Saved file '/tmp/scene.hip'"));
    assert(!match_saved_file("Loading file '/tmp/frame.exr'"));

    std::cout << "test_saved_file: PASSED\n";
}

void test_frame_range_direct() {
    auto range = match_frame_range("Frame range: 1001-1100");
    assert(range);
    assert(range->origin == log_event::RangeOrigin::Direct);
    assert(range->start == 1001);
    assert(range->end == 1100);
    assert(!range->step);

    // End before start is not a range
    assert(!match_frame_range("Frame range: 20-10"));

    std::cout << "test_frame_range_direct: PASSED\n";
}

void test_frame_range_command_echo() {
    auto range = match_frame_range("-s 10 -e 19");
    assert(range);
    assert(range->origin == log_event::RangeOrigin::CommandEcho);
    assert(range->start == 10);
    assert(range->end == 19);
    assert(!range->step);

    auto stepped = match_frame_range(
        "hython /opt/ropmon/render_rop.py -i /job/a.hip -o /out/rs -s 1 -e 9 -u True -r False -t 2");
    assert(stepped);
    assert(stepped->origin == log_event::RangeOrigin::CommandEcho);
    assert(stepped->start == 1);
    assert(stepped->end == 9);
    assert(stepped->step && *stepped->step == 2);

    // "-s" inside a word must not count
    assert(!match_frame_range("Redshift-shaders -e 10"));

    std::cout << "test_frame_range_command_echo: PASSED\n";
}

void test_frame_range_rop_metadata() {
    auto range = match_frame_range("ROP /out/Redshift_ROP1 f1: 1 f2: 240 f3: 4");
    assert(range);
    assert(range->origin == log_event::RangeOrigin::RopMetadata);
    assert(range->start == 1);
    assert(range->end == 240);
    assert(range->step && *range->step == 4);

    auto compact = match_frame_range("ROP settings f1:5 f2:8");
    assert(compact);
    assert(compact->start == 5 && compact->end == 8);

    std::cout << "test_frame_range_rop_metadata: PASSED\n";
}

void test_frame_started() {
    auto quoted = match_frame_started("'Redshift_ROP1' rendering frame 5");
    assert(quoted);
    assert(quoted->node == "Redshift_ROP1");
    assert(quoted->frame == 5);

    auto bare = match_frame_started("/out/mantra1 rendering frame 1001");
    assert(bare);
    assert(bare->node == "/out/mantra1");
    assert(bare->frame == 1001);

    assert(!match_frame_started("rendering frame buffer"));
    // Out of int range is not a frame
    assert(!match_frame_started("'rop' rendering frame 99999999999"));

    std::cout << "test_frame_started: PASSED\n";
}

void test_skip_and_loading() {
    assert(match_frame_skipped("Skip rendering enabled. File already rendered"));
    assert(match_frame_skipped("Frame 12 Skipped - File already exists"));
    assert(!match_frame_skipped("Skipping unused AOV"));

    assert(match_frame_loading_options("Loading RS rendering options"));
    assert(!match_frame_loading_options("Loading scene"));

    assert(match_frame_ended("ROP node endRender"));

    std::cout << "test_skip_and_loading: PASSED\n";
}

void test_block_progress() {
    auto block = match_block_progress("Block 3/16 (7,2) rendered by GPU 0 in 12ms");
    assert(block);
    assert(block->block == 3);
    assert(block->total == 16);

    assert(!match_block_progress("Block 1/0"));
    assert(!match_block_progress("Blocked on I/O"));

    std::cout << "test_block_progress: PASSED\n";
}

void test_frame_completed() {
    auto done = match_frame_completed(
        "Rendering time: 12.3s (1 GPU(s) used) scene extraction time 0.51 sec, total time 13.25 sec");
    assert(done);
    assert(done->seconds > 13.24 && done->seconds < 13.26);

    auto whole = match_frame_completed("scene extraction time 1 sec, total time 42 sec");
    assert(whole);
    assert(whole->seconds == 42.0);

    assert(!match_frame_completed("total time 13.25 sec"));

    std::cout << "test_frame_completed: PASSED\n";
}

void test_output_file_marker() {
    auto output = match_output_file("ropmon_outputfile: /renders/beauty.$F4.exr  ");
    assert(output);
    assert(output->path == "/renders/beauty.$F4.exr");

    assert(!match_output_file("ropmon_outputfile:"));
    assert(!match_output_file("note ropmon_outputfile: /x.exr"));

    std::cout << "test_output_file_marker: PASSED\n";
}

void test_extract_events_order() {
    // Most lines are noise
    assert(extract_events("").empty());
    assert(extract_events("Redshift Version: 3.5.19").empty());
    assert(extract_events("Allocating VRAM for device 0").empty());

    auto started = extract_events("'Redshift_ROP1' rendering frame 7");
    assert(started.size() == 1);
    assert(event_at<log_event::FrameStarted>(started, 0));

    // Skip wins over loading options on the same line
    auto mixed = extract_events("Skip rendering enabled. File already rendered. Loading RS rendering options");
    assert(mixed.size() == 1);
    assert(event_at<log_event::FrameSkipped>(mixed, 0));

    // A started frame echoed with a command line yields range first
    auto both = extract_events("'rop' rendering frame 3 -s 1 -e 10");
    assert(both.size() == 2);
    assert(event_at<log_event::FrameRangeAnnounced>(both, 0));
    assert(event_at<log_event::FrameStarted>(both, 1));

    std::cout << "test_extract_events_order: PASSED\n";
}

int main() {
    std::cout << "Running log event extractor tests...\n";

    test_saved_file();
    test_frame_range_direct();
    test_frame_range_command_echo();
    test_frame_range_rop_metadata();
    test_frame_started();
    test_skip_and_loading();
    test_block_progress();
    test_frame_completed();
    test_output_file_marker();
    test_extract_events_order();

    std::cout << "All log event extractor tests passed!\n";
    return 0;
}
