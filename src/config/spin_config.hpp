/// @file spin_config.hpp
/// @brief Tunables for windowing, spin physics and the controller

#pragma once

#include <cstddef>

namespace drawreel {

/// Everything that shapes a spin. The defaults are the canonical reel; the
/// demo app and tests override individual fields.
struct SpinConfig {
    // --- Windowing ---
    std::size_t window_capacity = 100; ///< Entries materialized at once
    bool prefetch_winner_window = true; ///< Build the winner window on a background task at spin start

    // --- Layout (same units as scroll positions) ---
    double item_height = 80.0; ///< Height of one slot
    int center_offset = 2;     ///< Slots between the viewport top and the winner line

    // --- Phase 1: initial flight ---
    int min_rotations = 7; ///< Whole window cycles, inclusive range
    int max_rotations = 10;

    // --- Phase 2: re-target ---
    double checkpoint_start = 0.05; ///< Spin progress at which the window swap fires
    double checkpoint_end = 0.20;   ///< Swaps after this are logged as late
    int retarget_min_rotations = 5; ///< Inclusive range
    int retarget_max_rotations = 7;
    double retarget_min_duration = 0.6; ///< Second segment length, as a fraction of the spin duration
    double retarget_max_duration = 0.9;
};

/// Checks ranges and orderings.
/// @throws std::invalid_argument describing the first offending field
void validate_config(const SpinConfig& config);

} // namespace drawreel
