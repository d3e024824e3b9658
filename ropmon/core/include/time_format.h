/*
 * File:        time_format.h
 * Module:      ropmon-core
 * Purpose:     Human readable durations and clock times
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <string>

namespace ropmon {

/// Whole-second compact form used in frame headers: "1d2h3m4s", "12s", "0s"
std::string format_duration_compact(double seconds);

/// Status-line form: "45.5s", "1m 30.0s", "1h 2m 3.0s"
std::string format_duration(double seconds);

/// Local wall-clock time as "hh:mm:ss AM"
std::string format_clock(std::chrono::system_clock::time_point time);

/// Banner timestamp, e.g. " 3:07PM CET on Jan 05, 2026 "
std::string format_banner_time(std::chrono::system_clock::time_point time);

} // namespace ropmon
