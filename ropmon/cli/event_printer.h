/*
 * File:        event_printer.h
 * Module:      ropmon-cli
 * Purpose:     Terminal presentation of render events
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "render_events.h"

#include <cstdint>
#include <iosfwd>
#include <optional>

namespace ropmon {
namespace cli {

struct PrinterOptions {
    bool show_log = false;       ///< Echo every renderer log line
    bool color = true;           ///< ANSI colours for formatted text
    bool status_line = true;     ///< Live progress/ETA line on stderr
};

/**
 * @brief Prints RenderEvents the way the GUI log view would show them
 *
 * Formatted text goes to the output stream; the progress line is redrawn
 * in place on the status stream.
 */
class EventPrinter {
public:
    EventPrinter(std::ostream& out, std::ostream& status, PrinterOptions options);

    void print(const RenderEvent& event);

    bool job_finished() const { return finished_.has_value(); }
    const std::optional<render_event::JobFinished>& finished() const { return finished_; }

    int32_t frames_completed() const { return frames_completed_; }
    int32_t frames_skipped() const { return frames_skipped_; }
    int32_t frames_failed() const { return frames_failed_; }

private:
    void print_text(const render_event::TextOutput& text);
    void redraw_status();
    void clear_status();

    std::ostream& out_;
    std::ostream& status_;
    PrinterOptions options_;

    render_event::ProgressChanged progress_;
    std::optional<render_event::FrameProgressChanged> frame_progress_;
    TimeSnapshot times_;
    bool status_visible_ = false;

    int32_t frames_completed_ = 0;
    int32_t frames_skipped_ = 0;
    int32_t frames_failed_ = 0;
    std::optional<render_event::JobFinished> finished_;
};

} // namespace cli
} // namespace ropmon
