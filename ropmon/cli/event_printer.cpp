/*
 * File:        event_printer.cpp
 * Module:      ropmon-cli
 * Purpose:     Terminal presentation of render events
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "event_printer.h"
#include "time_format.h"

#include <fmt/format.h>
#include <cstdlib>
#include <ostream>
#include <type_traits>

namespace ropmon {
namespace cli {

namespace {

// "#rrggbb" to a 24-bit ANSI foreground sequence
std::string ansi_color(const std::string& color, bool bold) {
    std::string seq;
    if (color.size() == 7 && color[0] == '#') {
        char* end = nullptr;
        unsigned long rgb = std::strtoul(color.c_str() + 1, &end, 16);
        if (end != nullptr && *end == '\0') {
            seq = fmt::format("\x1b[38;2;{};{};{}m", (rgb >> 16) & 0xff, (rgb >> 8) & 0xff, rgb & 0xff);
        }
    }
    if (bold) {
        seq += "\x1b[1m";
    }
    return seq;
}

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr size_t CENTER_WIDTH = 80;

// Centre every non-empty line of text within CENTER_WIDTH columns
std::string center_lines(const std::string& text) {
    std::string result;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
        if (!line.empty() && line.size() < CENTER_WIDTH) {
            result += std::string((CENTER_WIDTH - line.size()) / 2, ' ');
        }
        result += line;
        if (nl == std::string::npos) {
            break;
        }
        result += '\n';
        pos = nl + 1;
    }
    return result;
}

} // anonymous namespace

EventPrinter::EventPrinter(std::ostream& out, std::ostream& status, PrinterOptions options)
    : out_(out)
    , status_(status)
    , options_(options)
{
}

void EventPrinter::print(const RenderEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, render_event::TextOutput>) {
            print_text(e);
        } else if constexpr (std::is_same_v<T, render_event::RawLogLine>) {
            if (options_.show_log) {
                clear_status();
                out_ << e.text << '\n';
            }
        } else if constexpr (std::is_same_v<T, render_event::ProgressChanged>) {
            progress_ = e;
            redraw_status();
        } else if constexpr (std::is_same_v<T, render_event::FrameProgressChanged>) {
            frame_progress_ = e;
            redraw_status();
        } else if constexpr (std::is_same_v<T, render_event::FrameFinished>) {
            ++frames_completed_;
            frame_progress_.reset();
        } else if constexpr (std::is_same_v<T, render_event::FrameWasSkipped>) {
            ++frames_skipped_;
        } else if constexpr (std::is_same_v<T, render_event::FrameFailed>) {
            ++frames_failed_;
            print_text(render_event::TextOutput{fmt::format("   Frame {} did not finish\n\n", e.frame),
                                                text_color::ALERT, false, false});
        } else if constexpr (std::is_same_v<T, render_event::ImageProduced>) {
            clear_status();
            out_ << "   Output   " << e.path << '\n';
        } else if constexpr (std::is_same_v<T, render_event::TimeLabels>) {
            times_ = e.times;
            redraw_status();
        } else if constexpr (std::is_same_v<T, render_event::FrameHeader>) {
            frame_progress_ = render_event::FrameProgressChanged{e.frame, 0};
        } else if constexpr (std::is_same_v<T, render_event::JobFinished>) {
            // Leave the final figures on screen
            redraw_status();
            if (status_visible_) {
                status_ << '\n';
                status_visible_ = false;
            }
            finished_ = e;
        }
    }, event);
    out_.flush();
}

void EventPrinter::print_text(const render_event::TextOutput& text) {
    clear_status();
    std::string body = text.center ? center_lines(text.text) : text.text;
    bool styled = options_.color && (!text.color.empty() || text.bold);
    if (styled) {
        out_ << ansi_color(text.color, text.bold) << body << ANSI_RESET;
    } else {
        out_ << body;
    }
}

void EventPrinter::redraw_status() {
    if (!options_.status_line) {
        return;
    }

    std::string line = fmt::format("Frames {}/{}", progress_.current, progress_.total);
    if (frame_progress_) {
        line += fmt::format("  Frame {} {:>3}%", frame_progress_->frame, frame_progress_->percent);
    }
    line += fmt::format("  Elapsed {}", format_duration(times_.elapsed));
    if (times_.average > 0.0) {
        line += fmt::format("  Avg {}", format_duration(times_.average));
    }
    line += fmt::format("  Total {}  Remaining {}", format_duration(times_.estimated_total),
                        format_duration(times_.remaining));
    if (times_.show_eta) {
        line += fmt::format("  ETA {}", format_clock(times_.eta));
    }

    status_ << "\r\x1b[2K" << line;
    status_.flush();
    status_visible_ = true;
}

void EventPrinter::clear_status() {
    if (status_visible_) {
        status_ << "\r\x1b[2K";
        status_.flush();
        status_visible_ = false;
    }
}

} // namespace cli
} // namespace ropmon
