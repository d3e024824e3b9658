/*
 * File:        command_render.h
 * Module:      ropmon-cli
 * Purpose:     Render command header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "event_printer.h"
#include "monitor_config.h"
#include "render_job.h"

#include <string>

namespace ropmon {
namespace cli {

struct RenderOptions {
    MonitorConfig config;
    RenderJob job;
    bool query_rop_range = true;   ///< Ask hython for the ROP range when none is given
    PrinterOptions printer;
};

int render_command(const RenderOptions& options);

} // namespace cli
} // namespace ropmon
