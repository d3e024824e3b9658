/*
 * File:        log_event_extractor.cpp
 * Module:      ropmon-core
 * Purpose:     Pattern recognizers for Houdini / Redshift log lines
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "log_event_extractor.h"

#include <charconv>
#include <cstdlib>
#include <regex>

namespace ropmon {

const char* range_origin_name(log_event::RangeOrigin origin) {
    switch (origin) {
        case log_event::RangeOrigin::Direct:      return "direct";
        case log_event::RangeOrigin::CommandEcho: return "command-echo";
        case log_event::RangeOrigin::RopMetadata: return "rop-metadata";
    }
    return "unknown";
}

namespace {

// Frame numbers come out of free text; anything that does not fit an
// int32 is treated as no match rather than an error.
std::optional<int32_t> parse_int(const std::string& text) {
    int32_t value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

bool contains(const std::string& line, const char* needle) {
    return line.find(needle) != std::string::npos;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::optional<log_event::SavedFile> match_saved_file(const std::string& line) {
    if (!contains(line, "Saved file")) {
        return std::nullopt;
    }

    static const std::regex quoted(R"(Saved file ['"]([^'"]+\.(?:exr|png|jpg|jpeg|tif|tiff))['"])",
                                   std::regex::icase);
    static const std::regex bare(R"(Saved file (\S+\.(?:exr|png|jpg|jpeg|tif|tiff))(?:\s|$))",
                                 std::regex::icase);

    std::smatch match;
    if (std::regex_search(line, match, quoted) || std::regex_search(line, match, bare)) {
        return log_event::SavedFile{match[1].str()};
    }
    return std::nullopt;
}

std::optional<log_event::FrameRangeAnnounced> match_frame_range(const std::string& line) {
    static const std::regex direct(R"(Frame range: (-?\d+)-(-?\d+))");
    static const std::regex echo(R"((?:^|\s)-s\s+(-?\d+)\b.*?\s-e\s+(-?\d+)\b)");
    static const std::regex echo_step(R"((?:^|\s)-t\s+(\d+)\b)");
    static const std::regex rop(R"(ROP.*f1:\s*(-?\d+).*f2:\s*(-?\d+))");
    static const std::regex rop_step(R"(f3:\s*(\d+))");

    std::smatch match;
    log_event::FrameRangeAnnounced range;

    if (std::regex_search(line, match, direct)) {
        range.origin = log_event::RangeOrigin::Direct;
    } else if (contains(line, "-s") && contains(line, "-e") && std::regex_search(line, match, echo)) {
        range.origin = log_event::RangeOrigin::CommandEcho;
    } else if (contains(line, "ROP") && std::regex_search(line, match, rop)) {
        range.origin = log_event::RangeOrigin::RopMetadata;
    } else {
        return std::nullopt;
    }

    auto start = parse_int(match[1].str());
    auto end = parse_int(match[2].str());
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }
    range.start = *start;
    range.end = *end;

    const std::regex* step_pattern = nullptr;
    if (range.origin == log_event::RangeOrigin::CommandEcho) {
        step_pattern = &echo_step;
    } else if (range.origin == log_event::RangeOrigin::RopMetadata) {
        step_pattern = &rop_step;
    }

    std::smatch step_match;
    if (step_pattern && std::regex_search(line, step_match, *step_pattern)) {
        auto step = parse_int(step_match[1].str());
        if (step && *step > 0) {
            range.step = *step;
        }
    }
    return range;
}

std::optional<log_event::FrameStarted> match_frame_started(const std::string& line) {
    if (!contains(line, "rendering frame")) {
        return std::nullopt;
    }

    static const std::regex pattern(R"((?:'([^']+)'|(\S+)) rendering frame (-?\d+))");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }

    auto frame = parse_int(match[3].str());
    if (!frame) {
        return std::nullopt;
    }
    return log_event::FrameStarted{match[1].matched ? match[1].str() : match[2].str(), *frame};
}

std::optional<log_event::FrameSkipped> match_frame_skipped(const std::string& line) {
    if (contains(line, "Skip rendering enabled. File already rendered") ||
        contains(line, "Skipped - File already exists")) {
        return log_event::FrameSkipped{};
    }
    return std::nullopt;
}

std::optional<log_event::FrameLoadingOptions> match_frame_loading_options(const std::string& line) {
    if (contains(line, "Loading RS rendering options")) {
        return log_event::FrameLoadingOptions{};
    }
    return std::nullopt;
}

std::optional<log_event::BlockProgress> match_block_progress(const std::string& line) {
    if (!contains(line, "Block ")) {
        return std::nullopt;
    }

    static const std::regex pattern(R"(Block (\d+)/(\d+))");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }

    auto block = parse_int(match[1].str());
    auto total = parse_int(match[2].str());
    if (!block || !total || *total <= 0) {
        return std::nullopt;
    }
    return log_event::BlockProgress{*block, *total};
}

std::optional<log_event::FrameEnded> match_frame_ended(const std::string& line) {
    if (contains(line, "ROP node endRender")) {
        return log_event::FrameEnded{};
    }
    return std::nullopt;
}

std::optional<log_event::FrameCompleted> match_frame_completed(const std::string& line) {
    if (!contains(line, "scene extraction time")) {
        return std::nullopt;
    }

    static const std::regex pattern(R"(total time (\d+(?:\.\d+)?) sec)");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }
    return log_event::FrameCompleted{std::strtod(match[1].str().c_str(), nullptr)};
}

std::optional<log_event::OutputFileAnnounced> match_output_file(const std::string& line) {
    static const std::string marker(OUTPUT_FILE_MARKER);
    if (line.compare(0, marker.size(), marker) != 0) {
        return std::nullopt;
    }

    std::string path = trim(line.substr(marker.size()));
    if (path.empty()) {
        return std::nullopt;
    }
    return log_event::OutputFileAnnounced{path};
}

std::vector<LogEvent> extract_events(const std::string& line) {
    std::vector<LogEvent> events;
    if (line.empty()) {
        return events;
    }

    if (auto saved = match_saved_file(line)) {
        events.emplace_back(std::move(*saved));
    }
    if (auto range = match_frame_range(line)) {
        events.emplace_back(*range);
    }
    if (auto started = match_frame_started(line)) {
        events.emplace_back(std::move(*started));
    }

    if (auto skipped = match_frame_skipped(line)) {
        events.emplace_back(*skipped);
    } else if (auto loading = match_frame_loading_options(line)) {
        events.emplace_back(*loading);
    } else if (auto ended = match_frame_ended(line)) {
        events.emplace_back(*ended);
    }

    if (auto block = match_block_progress(line)) {
        events.emplace_back(*block);
    } else if (auto completed = match_frame_completed(line)) {
        events.emplace_back(*completed);
    }

    if (auto output = match_output_file(line)) {
        events.emplace_back(std::move(*output));
    }
    return events;
}

} // namespace ropmon
