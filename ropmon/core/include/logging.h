/*
 * File:        logging.h
 * Module:      ropmon-core
 * Purpose:     Logging system interface
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace ropmon {

/// Initialize the logging system
/// Should be called once at application startup
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the default logger
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

} // namespace ropmon

// Convenient logging macros
#define ROPMON_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(ropmon::get_logger(), __VA_ARGS__)
#define ROPMON_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(ropmon::get_logger(), __VA_ARGS__)
#define ROPMON_LOG_INFO(...)     SPDLOG_LOGGER_INFO(ropmon::get_logger(), __VA_ARGS__)
#define ROPMON_LOG_WARN(...)     SPDLOG_LOGGER_WARN(ropmon::get_logger(), __VA_ARGS__)
#define ROPMON_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(ropmon::get_logger(), __VA_ARGS__)
#define ROPMON_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(ropmon::get_logger(), __VA_ARGS__)
