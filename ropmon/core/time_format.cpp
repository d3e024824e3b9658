/*
 * File:        time_format.cpp
 * Module:      ropmon-core
 * Purpose:     Human readable durations and clock times
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "time_format.h"

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace ropmon {

std::string format_duration_compact(double seconds) {
    int64_t total = static_cast<int64_t>(std::floor(std::max(0.0, seconds)));
    int64_t days = total / 86400;
    int64_t hours = (total % 86400) / 3600;
    int64_t minutes = (total % 3600) / 60;
    int64_t secs = total % 60;

    std::string result;
    if (days) result += fmt::format("{}d", days);
    if (hours) result += fmt::format("{}h", hours);
    if (minutes) result += fmt::format("{}m", minutes);
    if (secs || result.empty()) result += fmt::format("{}s", secs);
    return result;
}

std::string format_duration(double seconds) {
    seconds = std::max(0.0, seconds);
    if (seconds < 60.0) {
        return fmt::format("{:.1f}s", seconds);
    }
    if (seconds < 3600.0) {
        int minutes = static_cast<int>(seconds / 60.0);
        return fmt::format("{}m {:.1f}s", minutes, std::fmod(seconds, 60.0));
    }
    int hours = static_cast<int>(seconds / 3600.0);
    int minutes = static_cast<int>(std::fmod(seconds, 3600.0) / 60.0);
    return fmt::format("{}h {}m {:.1f}s", hours, minutes, std::fmod(seconds, 60.0));
}

std::string format_clock(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    return fmt::format("{:%I:%M:%S %p}", fmt::localtime(t));
}

std::string format_banner_time(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm local = fmt::localtime(t);
    // Hour without leading zero, padded like strftime's %l
    int hour12 = local.tm_hour % 12 == 0 ? 12 : local.tm_hour % 12;
    return fmt::format("{:>2}:{:%M%p %Z on %b %d, %Y} ", hour12, local);
}

} // namespace ropmon
