/*
 * File:        command_rops.h
 * Module:      ropmon-cli
 * Purpose:     Scene inspection commands (ROP listing, recent scenes)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "monitor_config.h"

#include <string>

namespace ropmon {
namespace cli {

struct RopsOptions {
    MonitorConfig config;
    std::string hip_path;
};

/// List the render nodes of a scene with their frame ranges
int rops_command(const RopsOptions& options);

struct RecentOptions {
    std::string home_directory;   ///< Empty = $HOME
};

/// List recently opened scenes from Houdini's file history
int recent_command(const RecentOptions& options);

} // namespace cli
} // namespace ropmon
