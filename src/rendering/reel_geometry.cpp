/// @file reel_geometry.cpp
/// @brief Viewport slot computation shared by renderers and landing checks

#include "rendering/reel_geometry.hpp"

#include "physics/spin_physics.hpp"

#include <cmath>

namespace drawreel {

std::vector<VisibleSlot> visible_slots(double position, const Window& window, double item_height,
                                       int visible_count) {
    std::vector<VisibleSlot> slots;
    if (window.empty() || item_height <= 0.0 || visible_count <= 0) {
        return slots;
    }

    const std::size_t n = window.size();
    double norm = normalize_position(position, static_cast<double>(n) * item_height);
    auto top = static_cast<std::size_t>(std::floor(norm / item_height)) % n;
    double pixel_offset = norm - std::floor(norm / item_height) * item_height;

    slots.reserve(static_cast<std::size_t>(visible_count) + 2);
    for (int row = -1; row <= visible_count; row++) {
        // Shift by n so the buffer row above slot 0 wraps to the window's end
        std::size_t offset = (top + n + static_cast<std::size_t>(row + 1) - 1) % n;
        VisibleSlot slot;
        slot.participant = window.entries[offset];
        slot.window_offset = offset;
        slot.row = row;
        slot.y = static_cast<double>(row) * item_height - pixel_offset;
        slots.push_back(slot);
    }
    return slots;
}

const Participant* centered_entry(double position, const Window& window, double item_height,
                                  int center_offset) {
    if (window.empty()) {
        return nullptr;
    }
    return window.entries[centered_slot(position, window.size(), item_height, center_offset)];
}

} // namespace drawreel
