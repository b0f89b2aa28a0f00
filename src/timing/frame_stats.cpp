/// @file frame_stats.cpp
/// @brief Implements rolling frame-rate statistics

#include "timing/frame_stats.hpp"

#include <algorithm>

namespace drawreel {

FrameStats::FrameStats(std::size_t history) : history_limit_(std::max<std::size_t>(history, 1)) {}

void FrameStats::record(double frame_ms) {
    if (!(frame_ms > 0.0)) {
        return;
    }

    history_.push_back(frame_ms);
    history_sum_ += frame_ms;
    if (history_.size() > history_limit_) {
        history_sum_ -= history_.front();
        history_.pop_front();
    }

    total_frames_++;
    if (frame_ms > DROPPED_FRAME_MS) {
        dropped_frames_++;
    }
}

void FrameStats::reset() {
    history_.clear();
    history_sum_ = 0.0;
    total_frames_ = 0;
    dropped_frames_ = 0;
}

FrameMetrics FrameStats::metrics() const {
    FrameMetrics m;
    m.total_frames = total_frames_;
    m.dropped_frames = dropped_frames_;
    if (history_.empty()) {
        return m;
    }

    m.frame_time_ms = history_.back();
    m.fps = 1000.0 / m.frame_time_ms;
    m.average_fps = 1000.0 * static_cast<double>(history_.size()) / history_sum_;

    // Slowest frame gives the lowest rate
    auto [fastest, slowest] = std::minmax_element(history_.begin(), history_.end());
    m.min_fps = 1000.0 / *slowest;
    m.max_fps = 1000.0 / *fastest;
    return m;
}

bool FrameStats::below(double fps) const {
    return !history_.empty() && metrics().average_fps < fps;
}

} // namespace drawreel
