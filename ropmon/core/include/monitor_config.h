/*
 * File:        monitor_config.h
 * Module:      ropmon-core
 * Purpose:     Monitor configuration and job files (YAML)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include "render_job.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ropmon {

/// How the render backend is invoked
struct RenderSettings {
    std::string hython = "hython";
    std::string script;         ///< render_rop.py (defaults to the installed copy)
    std::string query_script;   ///< query_rops.py (defaults to the installed copy)

    RenderSettings();
};

/// Monitor loop tuning
struct MonitorSettings {
    int32_t read_timeout_ms = 100;
    int32_t refresh_interval_ms = 500;
    int32_t graceful_exit_timeout_ms = 10000;
    int32_t inference_margin = 5;
    double min_seconds_per_frame_guess = 0.5;
    std::vector<std::string> strip_prefixes{"[Redshift] ", "[Redshift]"};
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;
};

/**
 * @brief Complete monitor configuration
 *
 * Passed explicitly to whatever needs it; there is no global instance.
 */
struct MonitorConfig {
    RenderSettings render;
    MonitorSettings monitor;
    LoggingSettings logging;
};

/// Directory holding render_rop.py and query_rops.py
std::string default_share_directory();

/**
 * @brief Load configuration from a YAML file
 *
 * Keys that are absent keep their defaults.
 * @throws std::runtime_error if the file cannot be parsed or a value is invalid
 */
MonitorConfig load_config(const std::string& filename);

/// Write configuration to a YAML file
void save_config(const MonitorConfig& config, const std::string& filename);

/**
 * @brief Load a render job description
 *
 * job:
 *   hip: /path/scene.hip
 *   out_node: /out/Redshift_ROP1
 *   range: { start: 1, end: 100, step: 1 }   # optional
 *   skip_existing: true
 *
 * @throws std::runtime_error on parse errors or missing hip/out_node
 */
RenderJob load_job(const std::string& filename);

/// Write a render job description
void save_job(const RenderJob& job, const std::string& filename);

} // namespace ropmon
