/*
 * File:        render_events.h
 * Module:      ropmon-core
 * Purpose:     Notifications from the monitor thread to the presentation layer
 *
 * The monitor thread never calls into the presentation layer. Everything
 * it has to say is one of these messages, placed on an EventChannel in
 * log-line order.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_RENDER_EVENTS_H
#define ROPMON_CORE_RENDER_EVENTS_H

#include "timing_estimator.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ropmon {

// Colours used for formatted output
namespace text_color {
constexpr const char* BANNER = "#22adf2";
constexpr const char* COMMAND = "#ff6b2b";
constexpr const char* DIM = "#c0c0c0";
constexpr const char* ALERT = "#ff7a7a";
constexpr const char* FRAME_HEADER = "#50c878";
} // namespace text_color

namespace render_event {

/// Human readable output, with optional styling hints
struct TextOutput {
    std::string text;
    std::string color;      ///< "#rrggbb", empty for the default colour
    bool bold = false;
    bool center = false;
};

/// Normalized log line as received from the renderer
struct RawLogLine {
    std::string text;
};

struct ProgressChanged {
    int32_t current = 0;
    int32_t total = 0;
};

struct FrameProgressChanged {
    int32_t frame = 0;
    int32_t percent = 0;
};

struct FrameFinished {
    int32_t frame = 0;
    double duration_seconds = 0.0;
};

struct FrameWasSkipped {
    int32_t frame = 0;
};

/// Frame rendered but the job stopped before it finished
struct FrameFailed {
    int32_t frame = 0;
};

struct ImageProduced {
    std::string path;
};

struct TimeLabels {
    TimeSnapshot times;
};

/// A frame really started rendering (not skipped)
struct FrameHeader {
    int32_t frame = 0;
    std::chrono::system_clock::time_point started_at;
    std::optional<double> estimate_seconds;
};

/// Last message of every job
struct JobFinished {
    std::optional<int> exit_code;
    bool killed = false;
};

} // namespace render_event

using RenderEvent = std::variant<
    render_event::TextOutput,
    render_event::RawLogLine,
    render_event::ProgressChanged,
    render_event::FrameProgressChanged,
    render_event::FrameFinished,
    render_event::FrameWasSkipped,
    render_event::FrameFailed,
    render_event::ImageProduced,
    render_event::TimeLabels,
    render_event::FrameHeader,
    render_event::JobFinished
>;

} // namespace ropmon

#endif // ROPMON_CORE_RENDER_EVENTS_H
