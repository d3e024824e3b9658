/*
 * File:        timing_estimator.h
 * Module:      ropmon-core
 * Purpose:     Per-frame timing history and remaining-time estimation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_TIMING_ESTIMATOR_H
#define ROPMON_CORE_TIMING_ESTIMATOR_H

#include <chrono>
#include <cstdint>
#include <vector>

namespace ropmon {

/**
 * @brief Durations of completed frames, in completion order
 */
class TimingHistory {
public:
    void add(double seconds);
    void clear() { durations_.clear(); }

    bool empty() const { return durations_.empty(); }
    size_t size() const { return durations_.size(); }
    const std::vector<double>& durations() const { return durations_; }

    /// Arithmetic mean of every completed frame (0 when empty)
    double average() const;

    /**
     * @brief Trend-following estimate for the next frame
     *
     * 2 * last - second_last with at least two samples, clamped at 0;
     * otherwise the plain average.
     */
    double recent_estimate() const;

private:
    std::vector<double> durations_;
};

/// Which data the remaining-time figure was derived from
enum class EstimateBasis {
    NoTotal,        ///< Job size unknown, nothing to estimate
    Average,        ///< (total - done) * average frame time
    CurrentPace,    ///< elapsed / done, extrapolated over the job
    FlatGuess       ///< No completions yet; low confidence
};

struct RemainingEstimate {
    double remaining = 0.0;
    EstimateBasis basis = EstimateBasis::NoTotal;

    bool low_confidence() const { return basis == EstimateBasis::FlatGuess; }
};

/**
 * @brief Values for the time labels of the presentation layer
 *
 * elapsed + remaining == estimated_total holds for every snapshot.
 */
struct TimeSnapshot {
    double elapsed = 0.0;
    double average = 0.0;
    double estimated_total = 0.0;
    double remaining = 0.0;
    std::chrono::system_clock::time_point eta;
    bool show_eta = false;
    EstimateBasis basis = EstimateBasis::NoTotal;
};

class TimingEstimator {
public:
    explicit TimingEstimator(const TimingHistory& history, double min_seconds_per_frame_guess = 0.5);

    double average() const { return history_.average(); }
    double recent_estimate() const { return history_.recent_estimate(); }

    /**
     * @brief Remaining render time, tiered by data availability
     *
     * 1. A reliable average exists: (total - completed) * average
     * 2. At least one frame counted: elapsed / completed * total - elapsed
     * 3. Otherwise: max(floor, elapsed / 10) * total - elapsed
     *
     * Always non-negative; 0 when the total is unknown.
     */
    RemainingEstimate estimate_remaining(int32_t frames_completed, int32_t total_frames,
                                         double elapsed_so_far) const;

    /**
     * @brief Remaining time refined by the progress of the frame in flight
     *
     * @param frames_counted Frames counted so far, including the one rendering
     * @param frame_fraction Progress of the current frame, 0..1
     * @param frame_elapsed Seconds since the current frame started rendering
     */
    RemainingEstimate estimate_remaining_in_frame(int32_t frames_counted, int32_t total_frames,
                                                  double elapsed_so_far, double frame_fraction,
                                                  double frame_elapsed) const;

    /// Always elapsed + remaining, never computed independently
    static double estimate_total(double elapsed_so_far, double remaining) {
        return elapsed_so_far + remaining;
    }

    TimeSnapshot snapshot(const RemainingEstimate& estimate, int32_t total_frames, double elapsed_so_far,
                          std::chrono::system_clock::time_point now) const;

    /// Snapshot for a finished job: remaining is exactly 0, ETA hidden
    TimeSnapshot final_snapshot(double elapsed_so_far, std::chrono::system_clock::time_point now) const;

private:
    const TimingHistory& history_;
    double min_seconds_per_frame_guess_;
};

} // namespace ropmon

#endif // ROPMON_CORE_TIMING_ESTIMATOR_H
