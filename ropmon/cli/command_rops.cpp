/*
 * File:        command_rops.cpp
 * Module:      ropmon-cli
 * Purpose:     Scene inspection commands (ROP listing, recent scenes)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "command_rops.h"
#include "houdini_history.h"
#include "rop_metadata.h"
#include "logging.h"

#include <fmt/format.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace ropmon {
namespace cli {

int rops_command(const RopsOptions& options) {
    if (!fs::exists(options.hip_path)) {
        ROPMON_LOG_ERROR("Hip file not found: {}", options.hip_path);
        return 1;
    }

    ROPMON_LOG_INFO("Loading {} to list ROP nodes", options.hip_path);
    HythonRopMetadataProvider provider(options.config.render);
    auto rops = provider.list_rops(options.hip_path);

    if (rops.empty()) {
        std::cout << "No render nodes found in " << options.hip_path << "\n";
        return 1;
    }

    for (const auto& rop : rops) {
        if (rop.settings) {
            const RopSettings& s = *rop.settings;
            std::cout << fmt::format("{:<40} frames {}-{} step {}  skip existing: {}\n", rop.node_path,
                                     s.start_frame, s.end_frame, s.step, s.skip_existing ? "yes" : "no");
        } else {
            std::cout << fmt::format("{:<40} (settings unavailable)\n", rop.node_path);
        }
    }
    return 0;
}

int recent_command(const RecentOptions& options) {
    std::string home = options.home_directory;
    if (home.empty()) {
        const char* env_home = std::getenv("HOME");
        if (env_home == nullptr) {
            ROPMON_LOG_ERROR("HOME is not set");
            return 1;
        }
        home = env_home;
    }

    auto history_file = find_houdini_history_file(home);
    if (!history_file) {
        ROPMON_LOG_WARN("No Houdini file history found under {}", home);
        return 1;
    }

    ROPMON_LOG_DEBUG("Reading {}", *history_file);
    for (const auto& hip : parse_hip_history(*history_file)) {
        std::cout << hip << "\n";
    }
    return 0;
}

} // namespace cli
} // namespace ropmon
