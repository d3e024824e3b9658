/*
 * File:        timing_estimator.cpp
 * Module:      ropmon-core
 * Purpose:     Per-frame timing history and remaining-time estimation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "timing_estimator.h"

#include <algorithm>
#include <numeric>

namespace ropmon {

void TimingHistory::add(double seconds) {
    durations_.push_back(std::max(0.0, seconds));
}

double TimingHistory::average() const {
    if (durations_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(durations_.begin(), durations_.end(), 0.0);
    return sum / static_cast<double>(durations_.size());
}

double TimingHistory::recent_estimate() const {
    if (durations_.size() < 2) {
        return average();
    }
    double last = durations_[durations_.size() - 1];
    double second_last = durations_[durations_.size() - 2];
    return std::max(0.0, 2.0 * last - second_last);
}

TimingEstimator::TimingEstimator(const TimingHistory& history, double min_seconds_per_frame_guess)
    : history_(history)
    , min_seconds_per_frame_guess_(std::max(0.0, min_seconds_per_frame_guess))
{
}

RemainingEstimate TimingEstimator::estimate_remaining(int32_t frames_completed, int32_t total_frames,
                                                      double elapsed_so_far) const {
    RemainingEstimate estimate;
    if (total_frames <= 0) {
        return estimate;
    }

    double elapsed = std::max(0.0, elapsed_so_far);
    double average = history_.average();

    if (!history_.empty() && average > 0.0) {
        int32_t remaining_frames = std::max(0, total_frames - frames_completed);
        estimate.remaining = remaining_frames * average;
        estimate.basis = EstimateBasis::Average;
    } else if (frames_completed > 0) {
        double pace = elapsed / frames_completed;
        estimate.remaining = pace * total_frames - elapsed;
        estimate.basis = EstimateBasis::CurrentPace;
    } else {
        double guess = std::max(min_seconds_per_frame_guess_, elapsed / 10.0);
        estimate.remaining = guess * total_frames - elapsed;
        estimate.basis = EstimateBasis::FlatGuess;
    }

    estimate.remaining = std::max(0.0, estimate.remaining);
    return estimate;
}

RemainingEstimate TimingEstimator::estimate_remaining_in_frame(int32_t frames_counted, int32_t total_frames,
                                                               double elapsed_so_far, double frame_fraction,
                                                               double frame_elapsed) const {
    RemainingEstimate estimate;
    if (total_frames <= 0) {
        return estimate;
    }

    double elapsed = std::max(0.0, elapsed_so_far);
    double fraction = std::clamp(frame_fraction, 0.0, 1.0);
    double average = history_.average();
    // The frame in flight is counted but not done yet
    int32_t remaining_frames = std::max(0, total_frames - frames_counted + 1);

    if (!history_.empty() && average > 0.0) {
        estimate.remaining = remaining_frames * average;
        estimate.basis = EstimateBasis::Average;
    } else if (frames_counted > 1) {
        double done = (frames_counted - 1) + fraction;
        estimate.remaining = remaining_frames * (elapsed / done);
        estimate.basis = EstimateBasis::CurrentPace;
    } else if (fraction > 0.0) {
        double per_frame = std::max(0.0, frame_elapsed) / fraction;
        estimate.remaining = per_frame * (1.0 - fraction) + (total_frames - 1) * per_frame;
        estimate.basis = EstimateBasis::CurrentPace;
    } else {
        return estimate_remaining(0, total_frames, elapsed);
    }

    estimate.remaining = std::max(0.0, estimate.remaining);
    return estimate;
}

TimeSnapshot TimingEstimator::snapshot(const RemainingEstimate& estimate, int32_t total_frames,
                                       double elapsed_so_far, std::chrono::system_clock::time_point now) const {
    TimeSnapshot snap;
    snap.elapsed = std::max(0.0, elapsed_so_far);
    snap.average = history_.average();
    snap.remaining = std::max(0.0, estimate.remaining);
    snap.estimated_total = estimate_total(snap.elapsed, snap.remaining);
    snap.basis = estimate.basis;
    snap.show_eta = total_frames > 0;
    snap.eta = now + std::chrono::duration_cast<std::chrono::system_clock::duration>(
                         std::chrono::duration<double>(snap.remaining));
    return snap;
}

TimeSnapshot TimingEstimator::final_snapshot(double elapsed_so_far, std::chrono::system_clock::time_point now) const {
    TimeSnapshot snap;
    snap.elapsed = std::max(0.0, elapsed_so_far);
    snap.average = history_.average();
    snap.remaining = 0.0;
    snap.estimated_total = snap.elapsed;
    snap.eta = now;
    snap.show_eta = false;
    snap.basis = history_.empty() ? EstimateBasis::NoTotal : EstimateBasis::Average;
    return snap;
}

} // namespace ropmon
