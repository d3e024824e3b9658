/*
 * File:        command_replay.cpp
 * Module:      ropmon-cli
 * Purpose:     Replay a captured render log
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "command_replay.h"
#include "event_channel.h"
#include "log_line_reader.h"
#include "render_session.h"
#include "logging.h"

#include <fstream>
#include <iostream>

namespace ropmon {
namespace cli {

int replay_command(const ReplayOptions& options) {
    std::ifstream log(options.log_path, std::ios::binary);
    if (!log.is_open()) {
        ROPMON_LOG_ERROR("Unable to open log file: {}", options.log_path);
        return 1;
    }

    ROPMON_LOG_INFO("Replaying {}", options.log_path);

    EventChannel<RenderEvent> events;
    RenderSession session(options.frame_range, options.config.monitor, events);
    EventPrinter printer(std::cout, std::cerr, options.printer);

    auto flush = [&events, &printer]() {
        for (const auto& event : events.drain()) {
            printer.print(event);
        }
    };

    session.begin(RenderSession::Clock::now());

    size_t line_count = 0;
    std::string raw;
    while (std::getline(log, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        std::string line = normalize_log_line(decode_log_bytes(raw), options.config.monitor.strip_prefixes);
        session.process_line(line, RenderSession::Clock::now());
        ++line_count;
        flush();
    }

    JobEnd end;
    end.exit_code = 0;
    session.finish(RenderSession::Clock::now(), end);
    flush();

    const FrameTracker& tracker = session.tracker();
    ROPMON_LOG_INFO("Replayed {} lines: {} frame(s) counted of {} ({}), {} completed, {} skipped",
                    line_count, tracker.frames_counted(), tracker.total_frames(),
                    frame_total_source_name(tracker.discovery().source),
                    tracker.frames_completed(), tracker.frames_skipped());
    return 0;
}

} // namespace cli
} // namespace ropmon
