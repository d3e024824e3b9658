/*
 * File:        render_command.h
 * Module:      ropmon-core
 * Purpose:     Command line for the hython render backend
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "monitor_config.h"
#include "render_job.h"

#include <string>
#include <vector>

namespace ropmon {

struct RenderCommand {
    std::string program;
    std::vector<std::string> args;

    /// Space separated program and arguments, as echoed in the banner
    std::string to_string() const;
};

/**
 * @brief Build the render invocation for a job
 *
 * hython <script> -i <hip> -o <out> -s <start> -e <end>
 *        -u True|False -r True|False -t <step>
 *
 * Without an explicit range the start/end/step fields are 1/1/1 and -u is
 * False, leaving the ROP's own range in charge.
 */
RenderCommand build_render_command(const RenderSettings& settings, const RenderJob& job);

} // namespace ropmon
