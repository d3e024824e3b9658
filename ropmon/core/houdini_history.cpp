/*
 * File:        houdini_history.cpp
 * Module:      ropmon-core
 * Purpose:     Recently opened scenes from Houdini's file.history
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "houdini_history.h"
#include "logging.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace ropmon {

namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size()
        && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::optional<std::string> find_houdini_history_file(const std::string& home_directory) {
    std::error_code ec;
    fs::directory_iterator it(home_directory, ec);
    if (ec) {
        ROPMON_LOG_DEBUG("Cannot list '{}': {}", home_directory, ec.message());
        return std::nullopt;
    }

    std::vector<std::string> candidates;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.rfind("houdini", 0) != 0 || ends_with(name, ".py")) {
            continue;
        }
        if (entry.is_directory(ec)) {
            candidates.push_back(name);
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    // Newest version directory sorts last
    std::sort(candidates.begin(), candidates.end());
    fs::path history = fs::path(home_directory) / candidates.back() / "file.history";
    if (!fs::exists(history, ec)) {
        return std::nullopt;
    }
    return history.string();
}

std::vector<std::string> parse_hip_history_text(const std::string& content) {
    // Line breaks are not significant inside the section
    std::string joined;
    joined.reserve(content.size());
    for (char c : content) {
        if (c != '\n' && c != '\r') {
            joined += c;
        }
    }

    if (joined.rfind("HIP{", 0) != 0) {
        return {};
    }
    auto end = joined.find('}', 4);
    if (end == std::string::npos) {
        return {};
    }
    std::string section = joined.substr(4, end - 4);

    // Paths run together; a path ends at the first component ending in .hip
    std::vector<std::string> paths;
    std::string current;
    std::istringstream parts(section);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part.empty()) {
            continue;
        }
        current += '/';
        current += part;
        if (ends_with(current, ".hip")) {
            paths.push_back(current);
            current.clear();
        }
    }

    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& path : paths) {
        if (seen.insert(path).second) {
            unique.push_back(path);
        }
    }
    std::reverse(unique.begin(), unique.end());
    return unique;
}

std::vector<std::string> parse_hip_history(const std::string& history_file) {
    std::ifstream file(history_file);
    if (!file.is_open()) {
        ROPMON_LOG_WARN("Unable to open Houdini history file '{}'", history_file);
        return {};
    }
    std::ostringstream content;
    content << file.rdbuf();
    return parse_hip_history_text(content.str());
}

} // namespace ropmon
