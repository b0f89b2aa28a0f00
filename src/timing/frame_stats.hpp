/// @file frame_stats.hpp
/// @brief Rolling frame-rate statistics for the animation loop.
///
/// Fed one frame interval per displayed frame. Keeps a bounded history so the
/// numbers reflect the last couple of seconds rather than the whole session.

#pragma once

#include <cstddef>
#include <deque>

namespace drawreel {

/// Frame interval above which a frame counts as dropped (60 fps target)
constexpr double DROPPED_FRAME_MS = 1000.0 / 60.0;

/// Snapshot of the recorded frames
struct FrameMetrics {
    double fps = 0.0;           ///< Rate implied by the most recent frame
    double frame_time_ms = 0.0; ///< Most recent frame interval
    double average_fps = 0.0;   ///< Frames over elapsed time, across the history
    double min_fps = 0.0;
    double max_fps = 0.0;
    std::size_t total_frames = 0;   ///< Since the last reset()
    std::size_t dropped_frames = 0; ///< Since the last reset()
};

class FrameStats {
  public:
    /// @param history Number of recent frames kept for fps figures (at least 1)
    explicit FrameStats(std::size_t history = 120);

    /// Records one frame interval. Non-positive intervals are ignored.
    void record(double frame_ms);

    /// Forgets all frames
    void reset();

    [[nodiscard]] FrameMetrics metrics() const;

    /// True when frames have been recorded and the average rate is under `fps`
    [[nodiscard]] bool below(double fps) const;

  private:
    std::size_t history_limit_;
    std::deque<double> history_;
    double history_sum_ = 0.0;
    std::size_t total_frames_ = 0;
    std::size_t dropped_frames_ = 0;
};

} // namespace drawreel
