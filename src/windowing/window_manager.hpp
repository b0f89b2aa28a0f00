/// @file window_manager.hpp
/// @brief Builds the bounded windows the reel scrolls through
///
/// Both builders are pure functions of the index: the same inputs always give
/// windows with identical ordering, which is what lets the winner window be
/// computed on a background task ahead of the swap.

#pragma once

#include "participants/participant_index.hpp"
#include "windowing/window.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace drawreel {

/// The window shown before the winner is known.
///
/// - size <= capacity: the whole index, repeated from the start until the window
///   is full, so `position mod length` always has a full cycle to scroll through.
/// - size > capacity: the lowest `capacity - capacity/2` tickets followed by the
///   highest `capacity/2`, so the operator sees both ends of the real ticket range.
///
/// @return A window of exactly `capacity` entries
/// @throws std::invalid_argument if the index is empty or capacity is 0
[[nodiscard]] WindowPtr make_initial_window(const ParticipantIndex& index, std::size_t capacity);

/// The window the reel lands in.
///
/// - ticket not found: the initial window, with no winner offset.
/// - size <= capacity: the padded full index; offset is the winner's index position.
/// - otherwise: `capacity` consecutive entries starting `capacity/2` before the
///   winner, wrapping circularly past either end of the index; offset is
///   `capacity/2`, wherever the winner sits in the index.
///
/// @throws std::invalid_argument if the index is empty or capacity is 0
[[nodiscard]] WinnerWindow make_winner_window(const ParticipantIndex& index, std::size_t capacity,
                                              std::string_view target_ticket);

/// First offset in the window whose ticket normalizes equal to `ticket`
[[nodiscard]] std::optional<std::size_t> winner_offset_in(const Window& window,
                                                          std::string_view ticket);

} // namespace drawreel
