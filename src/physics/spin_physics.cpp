/// @file spin_physics.cpp
/// @brief Ease-out flight, one-shot re-target and exact landing

#include "physics/spin_physics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace drawreel {

double ease_out_cubic(double t) {
    t = std::clamp(t, 0.0, 1.0);
    double remaining = 1.0 - t;
    return 1.0 - remaining * remaining * remaining;
}

double normalize_position(double position, double circumference) {
    if (circumference <= 0.0) {
        return 0.0;
    }
    return std::fmod(std::fmod(position, circumference) + circumference, circumference);
}

double forward_distance(double from, double to, double circumference) {
    return normalize_position(to - from, circumference);
}

double slot_target_position(std::size_t slot, double item_height, int center_offset) {
    return (static_cast<double>(slot) - static_cast<double>(center_offset)) * item_height;
}

std::size_t centered_slot(double position, std::size_t window_length, double item_height,
                          int center_offset) {
    if (window_length == 0 || item_height <= 0.0) {
        return 0;
    }
    double circumference = static_cast<double>(window_length) * item_height;
    double top = normalize_position(position, circumference) / item_height;
    // Sample the middle of the winner row so landings a hair short of a slot
    // boundary still resolve to the intended slot
    auto slot = static_cast<std::size_t>(std::floor(top + static_cast<double>(center_offset) + 0.5));
    return slot % window_length;
}

DurationBounds duration_bounds(const SpinConfig& config, double nominal_ms) {
    return {nominal_ms * (config.checkpoint_start + config.retarget_min_duration),
            nominal_ms * (config.checkpoint_end + config.retarget_max_duration)};
}

SpinPhysics::SpinPhysics(const SpinConfig& config) : config_(config) {}

void SpinPhysics::begin(double now_ms, double duration_ms, double start_position,
                        std::size_t window_length, std::mt19937& rng) {
    if (!(duration_ms > 0.0)) {
        throw std::invalid_argument("Spin duration must be positive");
    }
    if (window_length == 0) {
        throw std::invalid_argument("Cannot spin through an empty window");
    }

    double circumference = static_cast<double>(window_length) * config_.item_height;
    std::uniform_int_distribution<int> rotations(config_.min_rotations, config_.max_rotations);
    double whole_turns = static_cast<double>(rotations(rng));

    // Provisional landing: the window midpoint
    double target = slot_target_position(window_length / 2, config_.item_height,
                                         config_.center_offset);
    double distance = forward_distance(start_position, target, circumference) +
                      whole_turns * circumference;

    spin_start_ = now_ms;
    nominal_duration_ = duration_ms;
    state_ = {};
    state_.start_timestamp = now_ms;
    state_.duration_ms = duration_ms;
    state_.total_distance = distance;
    state_.start_position = start_position;
    state_.final_position = start_position + distance;
    begun_ = true;
}

double SpinPhysics::retarget(double now_ms, std::size_t window_length, std::size_t winner_slot,
                             std::mt19937& rng) {
    if (!begun_) {
        throw std::logic_error("retarget() called before begin()");
    }
    if (state_.has_retargeted) {
        throw std::logic_error("A spin re-targets exactly once");
    }
    if (window_length == 0 || winner_slot >= window_length) {
        throw std::invalid_argument("Winner slot must lie inside a non-empty window");
    }

    // Sample the outgoing segment before touching state
    double swap_position = position_at(now_ms);
    double swap_velocity = velocity_at(now_ms);

    double circumference = static_cast<double>(window_length) * config_.item_height;
    std::uniform_int_distribution<int> rotations(config_.retarget_min_rotations,
                                                 config_.retarget_max_rotations);
    double whole_turns = static_cast<double>(rotations(rng));

    double target = slot_target_position(winner_slot, config_.item_height, config_.center_offset);
    double distance = forward_distance(swap_position, target, circumference) +
                      whole_turns * circumference;

    // Ease-out cubic starts at 3 * distance / duration; solve for the duration that
    // carries the current speed over, then keep it inside the configured range
    double min_duration = config_.retarget_min_duration * nominal_duration_;
    double max_duration = config_.retarget_max_duration * nominal_duration_;
    double duration = max_duration;
    if (swap_velocity > 0.0) {
        duration = 3.0 * distance / swap_velocity;
    }
    duration = std::clamp(duration, min_duration, max_duration);

    state_.start_timestamp = now_ms;
    state_.duration_ms = duration;
    state_.total_distance = distance;
    state_.start_position = swap_position;
    state_.final_position = swap_position + distance;
    state_.has_retargeted = true;
    return swap_position;
}

double SpinPhysics::segment_progress_at(double now_ms) const {
    if (state_.duration_ms <= 0.0) {
        return 1.0;
    }
    return std::clamp((now_ms - state_.start_timestamp) / state_.duration_ms, 0.0, 1.0);
}

double SpinPhysics::position_at(double now_ms) const {
    if (!begun_) {
        return state_.start_position;
    }
    if (is_finished(now_ms)) {
        // Exact landing, free of easing round-off
        return state_.final_position;
    }
    return state_.start_position + state_.total_distance * ease_out_cubic(segment_progress_at(now_ms));
}

double SpinPhysics::velocity_at(double now_ms) const {
    if (!begun_ || is_finished(now_ms)) {
        return 0.0;
    }
    double remaining = 1.0 - segment_progress_at(now_ms);
    return state_.total_distance * 3.0 * remaining * remaining / state_.duration_ms;
}

double SpinPhysics::spin_progress_at(double now_ms) const {
    if (!begun_ || nominal_duration_ <= 0.0) {
        return 0.0;
    }
    return (now_ms - spin_start_) / nominal_duration_;
}

bool SpinPhysics::checkpoint_due(double now_ms) const {
    return begun_ && !state_.has_retargeted && spin_progress_at(now_ms) >= config_.checkpoint_start;
}

bool SpinPhysics::checkpoint_late(double now_ms) const {
    return checkpoint_due(now_ms) && spin_progress_at(now_ms) > config_.checkpoint_end;
}

bool SpinPhysics::is_finished(double now_ms) const {
    return begun_ && now_ms - state_.start_timestamp >= state_.duration_ms;
}

} // namespace drawreel
