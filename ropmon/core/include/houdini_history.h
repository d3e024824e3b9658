/*
 * File:        houdini_history.h
 * Module:      ropmon-core
 * Purpose:     Recently opened scenes from Houdini's file.history
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ropmon {

/**
 * @brief Locate file.history in the newest ~/houdiniX.Y directory
 * @param home_directory Home directory to search
 * @return Path of the history file, or nullopt if there is none
 */
std::optional<std::string> find_houdini_history_file(const std::string& home_directory);

/**
 * @brief Extract .hip paths from the HIP{...} section of a history file
 *
 * Returns unique paths, most recent first. A missing or unreadable file
 * yields an empty list.
 */
std::vector<std::string> parse_hip_history(const std::string& history_file);

/// Same as parse_hip_history() for history text already in memory
std::vector<std::string> parse_hip_history_text(const std::string& content);

} // namespace ropmon
