/// @file spin_controller.cpp
/// @brief Implements the spin state machine and the one-shot window swap

#include "timing/spin_controller.hpp"

#include "participants/ticket_key.hpp"
#include "windowing/window_manager.hpp"

#include <cstdio>
#include <stdexcept>
#include <utility>

namespace drawreel {

SpinController::SpinController(const ParticipantIndex& index, const SpinConfig& config,
                               std::uint32_t seed)
    : index_(index), config_(config), rng_(seed) {
    validate_config(config_);

    // Rest with ticket 0 of the initial window on the winner line
    position_ = slot_target_position(0, config_.item_height, config_.center_offset);
    // Built once per roster; later spins start from whichever window the
    // previous spin left on display
    if (!index_.empty()) {
        window_ = make_initial_window(index_, config_.window_capacity);
    }
}

SpinStart SpinController::spin(const SpinRequest& request, double now_ms) {
    if (state_ == SpinState::SPINNING) {
        return SpinStart::IGNORED_BUSY;
    }
    if (!(request.min_duration_ms > 0.0)) {
        throw std::invalid_argument("Spin duration must be positive");
    }
    if (index_.empty()) {
        report_error("No participants available");
        return SpinStart::REJECTED_EMPTY;
    }

    ++spin_id_;
    target_ticket_ = request.target_ticket;
    winner_ = index_.find_by_ticket(target_ticket_);
    if (winner_ == nullptr) {
        std::fprintf(stderr,
                     "[drawreel] Ticket '%s' is not among %zu participants; spinning on the "
                     "fallback window.\n",
                     target_ticket_.c_str(), index_.size());
    }

    if (config_.prefetch_winner_window) {
        const ParticipantIndex* index = &index_;
        std::size_t capacity = config_.window_capacity;
        std::string ticket = target_ticket_;
        pending_window_ = std::async(std::launch::async, [index, capacity, ticket]() {
            return make_winner_window(*index, capacity, ticket);
        });
    } else {
        pending_window_ = {};
    }

    physics_.emplace(config_);
    physics_->begin(now_ms, request.min_duration_ms, position_, window_->size(), rng_);
    state_ = SpinState::SPINNING;
    std::fprintf(stderr, "[drawreel] Spin towards ticket '%s' over %.0f ms.\n",
                 target_ticket_.c_str(), request.min_duration_ms);
    return SpinStart::STARTED;
}

void SpinController::tick(double now_ms) {
    if (state_ != SpinState::SPINNING) {
        return;
    }
    const std::uint64_t spin = spin_id_;

    if (physics_->checkpoint_due(now_ms)) {
        swap_to_winner_window(now_ms);
    }

    position_ = physics_->position_at(now_ms);
    const bool finished = physics_->is_finished(now_ms);

    if (callbacks_.on_position) {
        // Hold our own reference: the callback may start a new spin and replace window_
        WindowPtr shown = window_;
        callbacks_.on_position(position_, *shown);
        if (state_ != SpinState::SPINNING || spin != spin_id_) {
            return;
        }
    }

    if (finished) {
        finish();
    }
}

void SpinController::cancel() {
    if (state_ == SpinState::SPINNING) {
        last_outcome_ = SpinState::CANCELLED;
    }
    ++spin_id_;
    state_ = SpinState::IDLE;
    physics_.reset();
    // Destroying an async future waits for the task; the window build is O(capacity)
    pending_window_ = {};
}

double SpinController::normalized_position() const {
    if (!window_) {
        return 0.0;
    }
    return normalize_position(position_, static_cast<double>(window_->size()) * config_.item_height);
}

void SpinController::swap_to_winner_window(double now_ms) {
    if (physics_->checkpoint_late(now_ms)) {
        std::fprintf(stderr, "[drawreel] Window swap late at %.0f%% of the spin (frame stall).\n",
                     physics_->spin_progress_at(now_ms) * 100.0);
    }

    WinnerWindow next = pending_window_.valid()
                            ? pending_window_.get()
                            : make_winner_window(index_, config_.window_capacity, target_ticket_);

    // Missing winner: land on the fallback window's midpoint so the reel still settles
    std::size_t slot = next.winner_offset.value_or(next.window->size() / 2);
    window_ = std::move(next.window);
    physics_->retarget(now_ms, window_->size(), slot, rng_);
}

void SpinController::finish() {
    physics_.reset();

    if (winner_ == nullptr) {
        state_ = SpinState::ERRORED;
        last_outcome_ = SpinState::ERRORED;
        report_error("Ticket '" + target_ticket_ + "' was not found among " +
                     std::to_string(index_.size()) + " participants");
        return;
    }

    std::size_t landed = centered_slot(position_, window_->size(), config_.item_height,
                                       config_.center_offset);
    if (normalize_ticket((*window_)[landed].ticket_number) !=
        normalize_ticket(winner_->ticket_number)) {
        std::fprintf(stderr, "[drawreel] Landed on ticket '%s' instead of '%s'.\n",
                     (*window_)[landed].ticket_number.c_str(), winner_->ticket_number.c_str());
    }

    state_ = SpinState::COMPLETED;
    last_outcome_ = SpinState::COMPLETED;
    if (callbacks_.on_complete) {
        callbacks_.on_complete(*winner_);
    }
}

void SpinController::report_error(const std::string& reason) {
    std::fprintf(stderr, "[drawreel] Spin error: %s\n", reason.c_str());
    if (callbacks_.on_error) {
        callbacks_.on_error(reason);
    }
}

} // namespace drawreel
