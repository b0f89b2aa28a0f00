/// @file spin_config.cpp
/// @brief SpinConfig validation

#include "config/spin_config.hpp"

#include <stdexcept>

namespace drawreel {

void validate_config(const SpinConfig& config) {
    if (config.window_capacity == 0) {
        throw std::invalid_argument("window_capacity must be at least 1");
    }
    if (!(config.item_height > 0.0)) {
        throw std::invalid_argument("item_height must be positive");
    }
    if (config.center_offset < 0) {
        throw std::invalid_argument("center_offset must not be negative");
    }
    if (!(config.min_rotations >= 1) || config.max_rotations < config.min_rotations) {
        throw std::invalid_argument("Rotation range must satisfy 1 <= min_rotations <= max_rotations");
    }
    if (!(config.retarget_min_rotations >= 1) ||
        config.retarget_max_rotations < config.retarget_min_rotations) {
        throw std::invalid_argument(
            "Re-target rotation range must satisfy 1 <= retarget_min_rotations <= retarget_max_rotations");
    }
    if (!(config.checkpoint_start > 0.0) || config.checkpoint_end < config.checkpoint_start ||
        !(config.checkpoint_end < 1.0)) {
        throw std::invalid_argument("Checkpoint window must satisfy 0 < start <= end < 1");
    }
    if (!(config.retarget_min_duration > 0.0) ||
        config.retarget_max_duration < config.retarget_min_duration) {
        throw std::invalid_argument("Re-target duration range must satisfy 0 < min <= max");
    }
}

} // namespace drawreel
