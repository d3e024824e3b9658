/*
 * File:        render_command.cpp
 * Module:      ropmon-core
 * Purpose:     Command line for the hython render backend
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_command.h"

#include <stdexcept>

namespace ropmon {

namespace {

const char* python_bool(bool value) {
    return value ? "True" : "False";
}

} // anonymous namespace

std::string RenderCommand::to_string() const {
    std::string text = program;
    for (const auto& arg : args) {
        text += ' ';
        text += arg;
    }
    return text;
}

RenderCommand build_render_command(const RenderSettings& settings, const RenderJob& job) {
    if (job.hip_path.empty() || job.out_node_path.empty()) {
        throw std::invalid_argument("Render job needs both a hip file and an output node");
    }

    FrameRange range = job.frame_range.value_or(FrameRange{});

    RenderCommand command;
    command.program = settings.hython;
    command.args = {
        settings.script,
        "-i", job.hip_path,
        "-o", job.out_node_path,
        "-s", std::to_string(range.start),
        "-e", std::to_string(range.end),
        "-u", python_bool(job.frame_range.has_value()),
        "-r", python_bool(job.skip_existing),
        "-t", std::to_string(range.step)
    };
    return command;
}

} // namespace ropmon
