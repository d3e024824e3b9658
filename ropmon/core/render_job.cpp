/*
 * File:        render_job.cpp
 * Module:      ropmon-core
 * Purpose:     Frame range helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_job.h"

namespace ropmon {

int32_t FrameRange::count() const {
    if (step <= 0 || end < start) {
        return 0;
    }
    return (end - start) / step + 1;
}

bool FrameRange::contains(int32_t frame) const {
    if (step <= 0 || frame < start || frame > end) {
        return false;
    }
    return (frame - start) % step == 0;
}

int32_t FrameRange::index_of(int32_t frame) const {
    return contains(frame) ? (frame - start) / step : -1;
}

int32_t FrameRange::last_frame() const {
    int32_t n = count();
    return n > 0 ? start + (n - 1) * step : start;
}

std::vector<int32_t> FrameRange::frames() const {
    std::vector<int32_t> result;
    int32_t n = count();
    result.reserve(static_cast<size_t>(n));
    for (int32_t i = 0; i < n; ++i) {
        result.push_back(start + i * step);
    }
    return result;
}

} // namespace ropmon
