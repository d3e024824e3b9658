/*
 * File:        render_job.h
 * Module:      ropmon-core
 * Purpose:     Render job description and frame range helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ropmon {

/**
 * @brief Inclusive frame range with a step
 *
 * Mirrors range(start, end + 1, step): frames are start, start + step, ...
 * up to and including end when end lies on the step grid.
 */
struct FrameRange {
    int32_t start = 1;
    int32_t end = 1;
    int32_t step = 1;

    /// Number of frames in the range (0 if empty or the step is not positive)
    int32_t count() const;

    /// True if frame lies on the step grid inside the range
    bool contains(int32_t frame) const;

    /// 0-based position of frame within the range, or -1 if not contained
    int32_t index_of(int32_t frame) const;

    /// Last frame actually rendered (end snapped down onto the step grid)
    int32_t last_frame() const;

    std::vector<int32_t> frames() const;

    bool operator==(const FrameRange& other) const {
        return start == other.start && end == other.end && step == other.step;
    }
};

/**
 * @brief One render invocation
 *
 * Only one RenderJob is active at a time; RenderController enforces this.
 */
struct RenderJob {
    std::string hip_path;
    std::string out_node_path;
    std::optional<FrameRange> frame_range;   ///< nullopt = let the ROP decide
    bool skip_existing = false;
};

} // namespace ropmon
