/*
 * File:        command_replay.h
 * Module:      ropmon-cli
 * Purpose:     Replay a captured render log
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "event_printer.h"
#include "monitor_config.h"
#include "render_job.h"

#include <optional>
#include <string>

namespace ropmon {
namespace cli {

struct ReplayOptions {
    MonitorConfig config;
    std::string log_path;
    std::optional<FrameRange> frame_range;   ///< As if given on the render command line
    PrinterOptions printer;
};

/// Run a captured log through the monitor engine without a render process
int replay_command(const ReplayOptions& options);

} // namespace cli
} // namespace ropmon
