/// @file window.hpp
/// @brief Bounded display window over a ParticipantIndex

#pragma once

#include "participants/participant.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace drawreel {

/// A fixed-length run of participants used for display and animation.
///
/// Entries are non-owning pointers into a ParticipantIndex and may repeat when
/// the index is smaller than the window. A window is never mutated after it is
/// built; a new one replaces the old one by swapping the WindowPtr.
struct Window {
    std::vector<const Participant*> entries;

    [[nodiscard]] std::size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }
    [[nodiscard]] const Participant& operator[](std::size_t offset) const { return *entries[offset]; }
};

/// Shared, immutable handle that is swapped atomically between frames
using WindowPtr = std::shared_ptr<const Window>;

/// A winner-centered window plus where the winner sits in it.
/// winner_offset is empty when the ticket was not found and the window is the
/// initial-pattern fallback.
struct WinnerWindow {
    WindowPtr window;
    std::optional<std::size_t> winner_offset;
};

} // namespace drawreel
