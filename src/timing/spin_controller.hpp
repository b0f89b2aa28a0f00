/// @file spin_controller.hpp
/// @brief Drives one spin at a time: window swap timing, physics re-target, callbacks.
///
/// The controller is cooperative and single-threaded. The host calls tick() once
/// per displayed frame with a monotonic timestamp; each call does a bounded
/// amount of work and returns. The winner window is built once per spin,
/// normally on a background task started by spin(), and published at the
/// checkpoint by swapping the WindowPtr.

#pragma once

#include "config/spin_config.hpp"
#include "participants/participant_index.hpp"
#include "physics/spin_physics.hpp"
#include "windowing/window.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>

namespace drawreel {

/// Lifecycle of the controller
enum class SpinState { IDLE, SPINNING, COMPLETED, CANCELLED, ERRORED };

/// Returns the human-readable name of a spin state
[[nodiscard]] constexpr std::string_view spin_state_name(SpinState state) {
    switch (state) {
    case SpinState::IDLE:
        return "IDLE";
    case SpinState::SPINNING:
        return "SPINNING";
    case SpinState::COMPLETED:
        return "COMPLETED";
    case SpinState::CANCELLED:
        return "CANCELLED";
    case SpinState::ERRORED:
        return "ERRORED";
    }
    return "UNKNOWN";
}

/// What spin() did with a request
enum class SpinStart {
    STARTED,       ///< A new spin is running
    IGNORED_BUSY,  ///< A spin was already running; the request was absorbed
    REJECTED_EMPTY ///< No participants; nothing was started
};

/// One spin, created per request and never modified
struct SpinRequest {
    std::string target_ticket;
    double min_duration_ms = 0.0; ///< Nominal length of the initial flight
};

/// Hooks fired from spin()/tick(). Any of them may be empty.
/// Callbacks may call spin() or cancel() on the controller.
struct SpinCallbacks {
    /// Every tick while spinning; the window must be treated as read-only
    std::function<void(double position, const Window& window)> on_position;
    /// Once per successful spin, with the participant from the full index
    std::function<void(const Participant& winner)> on_complete;
    /// Target ticket missing from the index, or a spin on an empty index
    std::function<void(const std::string& reason)> on_error;
};

class SpinController {
  public:
    /// @param index Participants of the competition; must outlive the controller
    /// @param config Validated on construction
    /// @param seed  Seed for the rotation-count random source
    /// @throws std::invalid_argument if the config is invalid
    SpinController(const ParticipantIndex& index, const SpinConfig& config, std::uint32_t seed);

    SpinController(const SpinController&) = delete;
    SpinController& operator=(const SpinController&) = delete;

    void set_callbacks(SpinCallbacks callbacks) { callbacks_ = std::move(callbacks); }

    /// Starts a spin towards request.target_ticket.
    /// From IDLE, COMPLETED, CANCELLED or ERRORED this goes straight to SPINNING.
    /// The flight starts on the window already on display, from the resting position.
    /// @throws std::invalid_argument if request.min_duration_ms <= 0
    SpinStart spin(const SpinRequest& request, double now_ms);

    /// Advances the running spin to `now_ms`. No-op unless SPINNING.
    void tick(double now_ms);

    /// Stops any spin and returns to IDLE. Safe from any state; once it returns
    /// no position, completion or error callback fires for the stopped spin.
    void cancel();

    [[nodiscard]] SpinState state() const { return state_; }

    /// How the most recent spin ended (IDLE if none has ended yet)
    [[nodiscard]] SpinState last_outcome() const { return last_outcome_; }

    /// Last published scroll position
    [[nodiscard]] double position() const { return position_; }

    /// position() reduced into one cycle of the current window
    [[nodiscard]] double normalized_position() const;

    /// Window currently on display (null only for an empty index)
    [[nodiscard]] const WindowPtr& window() const { return window_; }

    /// Winner of the current or last spin, resolved from the full index
    [[nodiscard]] const Participant* winner() const { return winner_; }

    /// Target ticket of the current or last spin
    [[nodiscard]] const std::string& target_ticket() const { return target_ticket_; }

    /// Physics of the running spin (nullptr when not spinning)
    [[nodiscard]] const SpinPhysics* physics() const {
        return physics_ ? &*physics_ : nullptr;
    }

    [[nodiscard]] const SpinConfig& config() const { return config_; }
    [[nodiscard]] const ParticipantIndex& index() const { return index_; }

  private:
    /// Publishes the winner window and re-targets the physics (once per spin)
    void swap_to_winner_window(double now_ms);

    /// Resolves the spin as COMPLETED or ERRORED and fires the matching callback
    void finish();

    void report_error(const std::string& reason);

    const ParticipantIndex& index_;
    SpinConfig config_;
    std::mt19937 rng_;
    SpinCallbacks callbacks_;

    SpinState state_ = SpinState::IDLE;
    SpinState last_outcome_ = SpinState::IDLE;
    std::optional<SpinPhysics> physics_;
    std::future<WinnerWindow> pending_window_;
    WindowPtr window_;
    std::string target_ticket_;
    const Participant* winner_ = nullptr;
    double position_ = 0.0;
    std::uint64_t spin_id_ = 0; ///< Bumped by spin()/cancel() to detect re-entry from callbacks
};

} // namespace drawreel
