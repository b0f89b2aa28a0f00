/// @file reel_renderer.cpp
/// @brief Draws reel slots, the winner line frame and edge shadows

#include "rendering/reel_renderer.hpp"

#include "rendering/reel_geometry.hpp"

#include <algorithm>
#include <string>

namespace drawreel {

namespace {

constexpr float CORNER_ROUNDNESS = 0.15f; // Raylib roundness parameter (0.0-1.0)
constexpr int CORNER_SEGMENTS = 4;
constexpr float DIVIDER_THICKNESS = 1.0f;
constexpr float TEXT_GAP = 4.0f;
constexpr int MIN_FONT_SIZE = 10;

Color to_color(Rgba c) {
    return {c.r, c.g, c.b, c.a};
}

/// Apply alpha modulation to a color
Color with_alpha(Color c, float alpha) {
    auto a = static_cast<unsigned char>(static_cast<float>(c.a) * std::clamp(alpha, 0.0f, 1.0f));
    return {c.r, c.g, c.b, a};
}

/// Font size scaled with the slot height, never below a readable minimum
int scaled_font(int size, float scale) {
    return std::max(MIN_FONT_SIZE, static_cast<int>(static_cast<float>(size) * scale));
}

void draw_centered_text(const char* text, float center_x, float y, int font_size, Color color) {
    int w = MeasureText(text, font_size);
    DrawText(text, static_cast<int>(center_x - static_cast<float>(w) / 2.0f), static_cast<int>(y),
             font_size, color);
}

/// Name over ticket, centered vertically in the slot
void draw_slot(const VisibleSlot& slot, Rectangle rect, const ThemeSettings& theme, float scale) {
    Color fill = slot.window_offset % 2 == 0 ? to_color(theme.slot_fill) : to_color(theme.slot_fill_alt);
    DrawRectangleRec(rect, fill);
    DrawLineEx({rect.x, rect.y + rect.height}, {rect.x + rect.width, rect.y + rect.height},
               DIVIDER_THICKNESS, to_color(theme.slot_divider));

    if (slot.participant == nullptr) {
        return;
    }

    int name_size = scaled_font(theme.name_font_size, scale);
    int ticket_size = scaled_font(theme.ticket_font_size, scale);
    float block_h = static_cast<float>(name_size + ticket_size) + TEXT_GAP;
    float top = rect.y + (rect.height - block_h) / 2.0f;
    float center_x = rect.x + rect.width / 2.0f;

    std::string name = slot.participant->display_name();
    std::string ticket = "#" + slot.participant->ticket_number;
    draw_centered_text(name.c_str(), center_x, top, name_size, to_color(theme.name_color));
    draw_centered_text(ticket.c_str(), center_x, top + static_cast<float>(name_size) + TEXT_GAP,
                       ticket_size, to_color(theme.ticket_color));
}

} // namespace

ReelRenderer::ReelRenderer(const SpinConfig& config)
    : item_height_(config.item_height), center_offset_(config.center_offset) {}

void ReelRenderer::draw(double scroll_position, const Window& window, const ThemeSettings& theme) {
    const Rectangle& vp = viewport_;
    const int visible = std::max(1, theme.visible_slots);
    const float slot_h = vp.height / static_cast<float>(visible);
    // Screen pixels per position unit
    const float scale = slot_h / static_cast<float>(item_height_);

    DrawRectangleRec(vp, to_color(theme.background));

    BeginScissorMode(static_cast<int>(vp.x), static_cast<int>(vp.y), static_cast<int>(vp.width),
                     static_cast<int>(vp.height));

    for (const VisibleSlot& slot : visible_slots(scroll_position, window, item_height_, visible)) {
        Rectangle rect = {vp.x, vp.y + static_cast<float>(slot.y) * scale, vp.width, slot_h};
        draw_slot(slot, rect, theme, scale);
    }

    // Edge shadows fade towards the winner line
    float shadow_h = vp.height * std::clamp(theme.shadow_size, 0.0f, 50.0f) / 100.0f;
    Color shadow = to_color(theme.shadow_color);
    if (shadow_h > 0.0f) {
        DrawRectangleGradientV(static_cast<int>(vp.x), static_cast<int>(vp.y),
                               static_cast<int>(vp.width), static_cast<int>(shadow_h),
                               with_alpha(shadow, theme.top_shadow_opacity), with_alpha(shadow, 0.0f));
        DrawRectangleGradientV(static_cast<int>(vp.x), static_cast<int>(vp.y + vp.height - shadow_h),
                               static_cast<int>(vp.width), static_cast<int>(shadow_h),
                               with_alpha(shadow, 0.0f),
                               with_alpha(shadow, theme.bottom_shadow_opacity));
    }

    EndScissorMode();

    // Winner line
    Rectangle line = {vp.x + 2.0f, vp.y + static_cast<float>(center_offset_) * slot_h, vp.width - 4.0f,
                      slot_h};
    DrawRectangleRoundedLines(line, CORNER_ROUNDNESS, CORNER_SEGMENTS, theme.border_thickness,
                              to_color(theme.highlight));

    DrawRectangleLinesEx(vp, theme.border_thickness, to_color(theme.border));
}

} // namespace drawreel
