/*
 * File:        log_event_extractor.h
 * Module:      ropmon-core
 * Purpose:     Pattern recognizers for Houdini / Redshift log lines
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "log_events.h"

#include <optional>
#include <string>
#include <vector>

namespace ropmon {

/// Prefix printed by render_rop.py after each frame with the output path
constexpr const char* OUTPUT_FILE_MARKER = "ropmon_outputfile:";

// One recognizer per event type. None of them throw; an unmatched line
// simply yields nullopt.

std::optional<log_event::SavedFile> match_saved_file(const std::string& line);

/// Tries "Frame range: A-B", then echoed "-s A -e B [-t S]", then ROP "f1:A f2:B"
std::optional<log_event::FrameRangeAnnounced> match_frame_range(const std::string& line);

std::optional<log_event::FrameStarted> match_frame_started(const std::string& line);
std::optional<log_event::FrameSkipped> match_frame_skipped(const std::string& line);
std::optional<log_event::FrameLoadingOptions> match_frame_loading_options(const std::string& line);
std::optional<log_event::BlockProgress> match_block_progress(const std::string& line);
std::optional<log_event::FrameEnded> match_frame_ended(const std::string& line);
std::optional<log_event::FrameCompleted> match_frame_completed(const std::string& line);
std::optional<log_event::OutputFileAnnounced> match_output_file(const std::string& line);

/**
 * @brief Run every recognizer over a normalized line
 *
 * Events come back in the order the monitor must apply them. Skip,
 * loading-options and frame-ended are mutually exclusive (first wins), as
 * are block progress and frame completion. Most lines produce nothing.
 */
std::vector<LogEvent> extract_events(const std::string& line);

} // namespace ropmon
