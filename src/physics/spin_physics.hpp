/// @file spin_physics.hpp
/// @brief Time-based scroll physics for one spin, with a single in-flight re-target
///
/// A spin scrolls through a cyclic window of circumference
/// `L = window_length * item_height`. Positions grow monotonically; renderers
/// reduce them with normalize_position(). Every query is a pure function of a
/// caller-supplied timestamp, so irregular frame delivery changes only how
/// smooth the intermediate positions look, never the duration or the landing.
///
/// Lifecycle:
///   1. begin():    initial flight towards a provisional target at the window midpoint
///   2. retarget(): exactly once, at the checkpoint, towards the true winner slot
///   3. once is_finished(), position_at() returns the exact final_position

#pragma once

#include "config/spin_config.hpp"

#include <cstddef>
#include <random>

namespace drawreel {

/// Mutable record of the active segment. Owned by one SpinPhysics.
struct PhysicsState {
    double start_timestamp = 0.0; ///< ms, start of the current segment
    double duration_ms = 0.0;     ///< Length of the current segment
    double total_distance = 0.0;  ///< Distance covered by the current segment
    double start_position = 0.0;
    double final_position = 0.0; ///< start_position + total_distance, exactly
    bool has_retargeted = false;
};

/// Earliest and latest completion time of a spin, measured from its start
struct DurationBounds {
    double min_ms = 0.0;
    double max_ms = 0.0;
};

/// 1 - (1 - t)^3, with t clamped to [0, 1]
[[nodiscard]] double ease_out_cubic(double t);

/// Reduces a scroll position into [0, circumference). Handles negative values.
[[nodiscard]] double normalize_position(double position, double circumference);

/// Distance to travel forward from `from` until the position is congruent to
/// `to` modulo the circumference. Result is in [0, circumference).
[[nodiscard]] double forward_distance(double from, double to, double circumference);

/// Scroll position that puts window slot `slot` on the winner line:
/// `(slot - center_offset) * item_height`
[[nodiscard]] double slot_target_position(std::size_t slot, double item_height, int center_offset);

/// Window slot under the winner line at `position`.
/// @return An offset in [0, window_length), or 0 for an empty window
[[nodiscard]] std::size_t centered_slot(double position, std::size_t window_length,
                                        double item_height, int center_offset);

/// Window in which a spin of nominal duration `nominal_ms` completes, given the
/// checkpoint window and re-target duration range. Completion is detected on a
/// tick, so callers add one frame interval to max_ms.
[[nodiscard]] DurationBounds duration_bounds(const SpinConfig& config, double nominal_ms);

class SpinPhysics {
  public:
    explicit SpinPhysics(const SpinConfig& config);

    /// Starts the initial flight.
    /// Rotation count is drawn from [min_rotations, max_rotations]; the landing
    /// is the window midpoint until retarget() supplies the real slot.
    /// @throws std::invalid_argument if duration_ms <= 0 or window_length == 0
    void begin(double now_ms, double duration_ms, double start_position, std::size_t window_length,
               std::mt19937& rng);

    /// Switches to a new window and lands on `winner_slot` in it.
    ///
    /// The new segment starts at the current position (no jump), re-draws the
    /// rotation count from the tighter re-target range, and picks a duration so
    /// the restarted ease-out curve begins at the current velocity, clamped to
    /// [retarget_min_duration, retarget_max_duration] of the spin duration.
    /// @return The position at the moment of the swap
    /// @throws std::logic_error if begin() was not called or a re-target already happened
    /// @throws std::invalid_argument if window_length == 0 or winner_slot is outside the window
    double retarget(double now_ms, std::size_t window_length, std::size_t winner_slot,
                    std::mt19937& rng);

    [[nodiscard]] double position_at(double now_ms) const;

    /// Scroll speed in position units per ms (0 once the segment has ended)
    [[nodiscard]] double velocity_at(double now_ms) const;

    /// Fraction of the nominal spin duration elapsed since begin(); may exceed 1
    [[nodiscard]] double spin_progress_at(double now_ms) const;

    /// True from checkpoint_start onwards until retarget() has run
    [[nodiscard]] bool checkpoint_due(double now_ms) const;

    /// True when a still-pending re-target has drifted past checkpoint_end
    [[nodiscard]] bool checkpoint_late(double now_ms) const;

    /// Current segment has run its full duration
    [[nodiscard]] bool is_finished(double now_ms) const;

    [[nodiscard]] bool has_begun() const { return begun_; }
    [[nodiscard]] const PhysicsState& state() const { return state_; }
    [[nodiscard]] double spin_start() const { return spin_start_; }
    [[nodiscard]] double nominal_duration() const { return nominal_duration_; }

  private:
    /// Clamped [0, 1] progress through the current segment
    [[nodiscard]] double segment_progress_at(double now_ms) const;

    SpinConfig config_;
    PhysicsState state_;
    double spin_start_ = 0.0;
    double nominal_duration_ = 0.0;
    bool begun_ = false;
};

} // namespace drawreel
