/*
 * File:        logging.cpp
 * Module:      ropmon-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <mutex>

namespace ropmon {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mutex;

namespace {

std::shared_ptr<spdlog::logger> create_logger(const std::string& pattern) {
    // Console output goes to stderr so the CLI can keep stdout for render output
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("ropmon", sink);
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

spdlog::level::level_enum parse_level(const std::string& level, bool& known) {
    known = true;
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    known = false;
    return spdlog::level::info;
}

} // anonymous namespace

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (!g_logger) {
            g_logger = create_logger(pattern);
        } else {
            g_logger->set_pattern(pattern);
        }

        if (!log_file.empty()) {
            try {
                // Add file sink while keeping console output
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_pattern(pattern);
                g_logger->sinks().push_back(file_sink);
            } catch (const spdlog::spdlog_ex& e) {
                g_logger->warn("Unable to log to '{}': {}", log_file, e.what());
            }
        }
    }

    set_log_level(level);
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        // Auto-initialize if not done yet
        g_logger = create_logger("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return g_logger;
}

void set_log_level(const std::string& level) {
    auto logger = get_logger();

    bool known = false;
    auto parsed = parse_level(level, known);
    if (!known) {
        logger->warn("Unknown log level '{}', using 'info'", level);
    }
    logger->set_level(parsed);
}

} // namespace ropmon
