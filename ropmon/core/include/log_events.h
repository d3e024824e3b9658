/*
 * File:        log_events.h
 * Module:      ropmon-core
 * Purpose:     Domain events recognized in the render log
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ropmon {
namespace log_event {

/// Where a frame range announcement was found
enum class RangeOrigin {
    Direct,        ///< "Frame range: A-B"
    CommandEcho,   ///< Echoed "-s A -e B [-t S]" command line flags
    RopMetadata    ///< ROP parameter dump "... f1:A ... f2:B"
};

struct SavedFile {
    std::string path;
};

struct FrameRangeAnnounced {
    int32_t start = 0;
    int32_t end = 0;
    std::optional<int32_t> step;
    RangeOrigin origin = RangeOrigin::Direct;
};

struct FrameStarted {
    std::string node;
    int32_t frame = 0;
};

/// Output exists, renderer will not re-render the current frame
struct FrameSkipped {};

/// Render engine began loading per-frame options: the frame really renders
struct FrameLoadingOptions {};

struct BlockProgress {
    int32_t block = 0;
    int32_t total = 0;
};

/// ROP end-of-frame hook fired
struct FrameEnded {};

struct FrameCompleted {
    double seconds = 0.0;
};

/// Marker printed by the render-side script with the resolved output path
struct OutputFileAnnounced {
    std::string path;
};

} // namespace log_event

using LogEvent = std::variant<
    log_event::SavedFile,
    log_event::FrameRangeAnnounced,
    log_event::FrameStarted,
    log_event::FrameSkipped,
    log_event::FrameLoadingOptions,
    log_event::BlockProgress,
    log_event::FrameEnded,
    log_event::FrameCompleted,
    log_event::OutputFileAnnounced
>;

const char* range_origin_name(log_event::RangeOrigin origin);

} // namespace ropmon
