/// @file theme.hpp
/// @brief Visual settings handed to a Renderer every frame

#pragma once

#include <cstdint>

namespace drawreel {

/// 8-bit RGBA colour, kept free of any graphics library type
struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

/// Colours and sizes of the reel. Layout of the slots themselves (slot height,
/// winner line) comes from SpinConfig so physics and drawing agree.
struct ThemeSettings {
    Rgba background = {26, 26, 26, 255};
    Rgba slot_fill = {38, 38, 46, 255};
    Rgba slot_fill_alt = {32, 32, 40, 255}; ///< Every other slot, for a striped reel
    Rgba slot_divider = {60, 60, 72, 255};
    Rgba border = {255, 215, 0, 255};
    Rgba highlight = {255, 20, 147, 255}; ///< Winner line frame
    Rgba name_color = {250, 250, 250, 255};
    Rgba ticket_color = {255, 215, 0, 255};
    Rgba shadow_color = {0, 0, 0, 255};

    int visible_slots = 5; ///< Slots shown at once
    int name_font_size = 22;
    int ticket_font_size = 28;

    float top_shadow_opacity = 0.3f;
    float bottom_shadow_opacity = 0.3f;
    float shadow_size = 30.0f; ///< Percent of the reel height covered by each shadow
    float border_thickness = 4.0f;
};

} // namespace drawreel
