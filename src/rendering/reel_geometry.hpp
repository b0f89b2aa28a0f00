/// @file reel_geometry.hpp
/// @brief Maps a scroll position onto the slots visible in the viewport

#pragma once

#include "windowing/window.hpp"

#include <cstddef>
#include <vector>

namespace drawreel {

/// One slot as it appears in the viewport
struct VisibleSlot {
    const Participant* participant = nullptr;
    std::size_t window_offset = 0; ///< Offset of the entry in the window
    int row = 0;                   ///< 0 = top row of the viewport; -1 is the buffer row above
    double y = 0.0;                ///< Top edge relative to the viewport top, in position units
};

/// Computes which window entries are on screen.
///
/// The normalized position picks the entry at the top row
/// (`floor(norm / item_height)`) and the sub-slot scroll offset
/// (`norm mod item_height`). One buffer row is added above and below so partially
/// visible slots are drawn while scrolling.
///
/// @return visible_count + 2 slots, top to bottom; empty for an empty window
[[nodiscard]] std::vector<VisibleSlot> visible_slots(double position, const Window& window,
                                                     double item_height, int visible_count);

/// Entry on the winner line at `position`, or nullptr for an empty window
[[nodiscard]] const Participant* centered_entry(double position, const Window& window,
                                                double item_height, int center_offset);

} // namespace drawreel
