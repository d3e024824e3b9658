/*
 * File:        rop_metadata.cpp
 * Module:      ropmon-core
 * Purpose:     Frame range and skip settings configured on ROP nodes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "rop_metadata.h"
#include "log_line_reader.h"
#include "logging.h"
#include "process_supervisor.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <utility>

namespace ropmon {

namespace {

constexpr const char* NODE_PREFIX = "NODE:";
constexpr const char* SETTINGS_PREFIX = "SETTINGS:";

bool starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// skip_rendered comes through as 0/1 from the parameter, but accept
// booleans too
bool read_flag(const YAML::Node& node) {
    if (!node) {
        return false;
    }
    bool as_bool = false;
    if (YAML::convert<bool>::decode(node, as_bool)) {
        return as_bool;
    }
    return node.as<int>(0) != 0;
}

} // anonymous namespace

std::optional<RopSettings> RopMetadataProvider::query(const std::string& hip_path, const std::string& node_path) {
    for (const auto& rop : list_rops(hip_path)) {
        if (rop.node_path == node_path) {
            return rop.settings;
        }
    }
    return std::nullopt;
}

std::optional<RopSettings> parse_rop_settings(const std::string& payload) {
    // The payload is JSON, which is also valid YAML flow syntax
    try {
        YAML::Node node = YAML::Load(payload);
        if (!node.IsMap()) {
            return std::nullopt;
        }
        RopSettings settings;
        settings.start_frame = node["f1"].as<int32_t>(1);
        settings.end_frame = node["f2"].as<int32_t>(settings.start_frame);
        settings.step = std::max<int32_t>(1, node["f3"].as<int32_t>(1));
        settings.skip_existing = read_flag(node["skip_rendered"]);
        if (settings.end_frame < settings.start_frame) {
            return std::nullopt;
        }
        return settings;
    } catch (const YAML::Exception& e) {
        ROPMON_LOG_DEBUG("Unreadable ROP settings '{}': {}", payload, e.what());
        return std::nullopt;
    }
}

std::vector<RopInfo> parse_rop_listing(const std::vector<std::string>& lines) {
    std::vector<RopInfo> rops;
    for (const auto& raw : lines) {
        std::string line = trim(raw);
        if (starts_with(line, NODE_PREFIX)) {
            std::string path = trim(line.substr(std::char_traits<char>::length(NODE_PREFIX)));
            if (!path.empty()) {
                rops.push_back(RopInfo{path, std::nullopt});
            }
        } else if (starts_with(line, SETTINGS_PREFIX)) {
            if (rops.empty()) {
                continue;
            }
            rops.back().settings = parse_rop_settings(line.substr(std::char_traits<char>::length(SETTINGS_PREFIX)));
        }
    }
    return rops;
}

HythonRopMetadataProvider::HythonRopMetadataProvider(RenderSettings settings, std::chrono::milliseconds timeout)
    : settings_(std::move(settings))
    , timeout_(timeout)
{
}

std::vector<RopInfo> HythonRopMetadataProvider::list_rops(const std::string& hip_path) {
    ProcessSupervisor process;
    process.start(settings_.hython, {settings_.query_script, hip_path});

    LineReader reader(process.output_fd());
    std::vector<std::string> lines;
    auto deadline = std::chrono::steady_clock::now() + timeout_;

    while (true) {
        if (std::chrono::steady_clock::now() >= deadline) {
            ROPMON_LOG_WARN("ROP query for '{}' timed out after {} ms", hip_path, timeout_.count());
            process.kill();
            break;
        }
        ReadResult result = reader.read_line(std::chrono::milliseconds(200));
        if (result.status == ReadStatus::Closed) {
            break;
        }
        if (result.status == ReadStatus::Line) {
            lines.push_back(decode_log_bytes(result.line));
        }
    }

    process.wait_for_exit(std::chrono::seconds(5));
    auto exit_code = process.poll_exit_code();
    if (!exit_code) {
        process.kill();
    } else if (*exit_code != 0) {
        ROPMON_LOG_WARN("ROP query for '{}' exited with code {}", hip_path, *exit_code);
    }

    std::vector<RopInfo> rops = parse_rop_listing(lines);
    ROPMON_LOG_DEBUG("ROP query for '{}' found {} node(s)", hip_path, rops.size());
    return rops;
}

} // namespace ropmon
