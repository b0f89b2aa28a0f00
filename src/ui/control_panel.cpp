/// @file control_panel.cpp
/// @brief Implements the control panel with custom-drawn Raylib UI elements

#include "ui/control_panel.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace drawreel {

namespace {

// --- Layout constants ---
constexpr float ROW_HEIGHT = 32.0f;
constexpr float ROW_GAP = 8.0f;
constexpr float FIELD_HEIGHT = 28.0f;
constexpr float BUTTON_HEIGHT = 30.0f;
constexpr float BUTTON_GAP = 4.0f;
constexpr float SLIDER_HEIGHT = 20.0f;
constexpr float SLIDER_VALUE_WIDTH = 40.0f;
constexpr float LABEL_WIDTH = 64.0f;
constexpr float PADDING = 10.0f;
constexpr int FONT_SIZE = 16;
constexpr int FONT_SIZE_SMALL = 13;
constexpr float SLIDER_EPSILON = 0.001f;
constexpr float MIN_DURATION_S = 1.0f;
constexpr float MAX_DURATION_S = 10.0f;

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color FIELD_BG = {25, 25, 32, 255};
const Color FIELD_BG_ACTIVE = {30, 30, 50, 255};
const Color FIELD_BORDER = {90, 90, 110, 255};
const Color FIELD_BORDER_ACTIVE = {100, 140, 255, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color BUTTON_BG_SPIN = {40, 120, 60, 255};
const Color BUTTON_BG_CANCEL = {130, 45, 45, 255};
const Color BUTTON_BG_DISABLED = {45, 45, 50, 255};
const Color BUTTON_TEXT = {220, 220, 230, 255};
const Color BUTTON_TEXT_DISABLED = {110, 110, 120, 255};
const Color SLIDER_TRACK = {50, 50, 60, 255};
const Color SLIDER_FILL = {60, 140, 200, 255};
const Color SLIDER_HANDLE = {180, 180, 200, 255};

/// Draw a free-text ticket field. Accepts any printable ASCII, since tickets
/// arrive in mixed formats ("T-43", "0042").
void draw_text_field(const char* label, char* buf, int capacity, int& cursor, bool& editing,
                     float x, float y, float w) {
    DrawText(label, static_cast<int>(x), static_cast<int>(y + 6), FONT_SIZE, LABEL_COLOR);

    float fx = x + LABEL_WIDTH;
    float fw = w - LABEL_WIDTH;
    Rectangle field_rect = {fx, y, fw, FIELD_HEIGHT};

    Vector2 mouse = GetMousePosition();
    bool hovered = CheckCollisionPointRec(mouse, field_rect);

    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        editing = hovered;
    }

    DrawRectangleRec(field_rect, editing ? FIELD_BG_ACTIVE : FIELD_BG);
    DrawRectangleLinesEx(field_rect, 1.0f, editing ? FIELD_BORDER_ACTIVE : FIELD_BORDER);

    if (editing) {
        int key = GetCharPressed();
        while (key > 0) {
            if (key >= 32 && key <= 126 && cursor < capacity - 1) {
                buf[cursor] = static_cast<char>(key);
                cursor++;
                buf[cursor] = '\0';
            }
            key = GetCharPressed();
        }

        if (IsKeyPressed(KEY_BACKSPACE) && cursor > 0) {
            cursor--;
            buf[cursor] = '\0';
        }

        if (IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER)) {
            editing = false;
        }

        // Draw cursor blink
        float text_w = static_cast<float>(MeasureText(buf, FONT_SIZE));
        float cx = fx + 6.0f + text_w;
        if (static_cast<int>(GetTime() * 2.0) % 2 == 0) {
            DrawLine(static_cast<int>(cx), static_cast<int>(y + 5), static_cast<int>(cx),
                     static_cast<int>(y + FIELD_HEIGHT - 5), TEXT_COLOR);
        }
    }

    DrawText(buf, static_cast<int>(fx + 6), static_cast<int>(y + 6), FONT_SIZE, TEXT_COLOR);
}

/// Draw a button. Returns true if clicked this frame (never when disabled).
bool draw_button(const char* text, float x, float y, float w, float h, Color bg_normal,
                 bool enabled = true) {
    Rectangle rect = {x, y, w, h};
    Vector2 mouse = GetMousePosition();
    bool hovered = enabled && CheckCollisionPointRec(mouse, rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    Color bg = enabled ? (hovered ? BUTTON_BG_HOVER : bg_normal) : BUTTON_BG_DISABLED;
    DrawRectangleRec(rect, bg);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureText(text, FONT_SIZE_SMALL);
    DrawText(text, static_cast<int>(x + (w - static_cast<float>(tw)) / 2.0f),
             static_cast<int>(y + (h - static_cast<float>(FONT_SIZE_SMALL)) / 2.0f),
             FONT_SIZE_SMALL, enabled ? BUTTON_TEXT : BUTTON_TEXT_DISABLED);

    return clicked;
}

/// Draw a horizontal slider. Returns true if the value changed.
bool draw_slider(const char* label, float& value, float min_val, float max_val, bool& dragging,
                 float x, float y, float w) {
    DrawText(label, static_cast<int>(x), static_cast<int>(y), FONT_SIZE_SMALL, LABEL_COLOR);

    float track_y = y + static_cast<float>(FONT_SIZE_SMALL) + 4.0f;
    Rectangle track = {x, track_y, w, SLIDER_HEIGHT};

    float norm = std::clamp((value - min_val) / (max_val - min_val), 0.0f, 1.0f);

    Vector2 mouse = GetMousePosition();
    bool hovered = CheckCollisionPointRec(mouse, track);

    if (hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        dragging = true;
    }
    if (!IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        dragging = false;
    }

    bool changed = false;
    if (dragging) {
        float new_norm = std::clamp((mouse.x - x) / w, 0.0f, 1.0f);
        float new_val = min_val + new_norm * (max_val - min_val);
        if (std::fabs(new_val - value) > SLIDER_EPSILON) {
            value = new_val;
            changed = true;
        }
        norm = new_norm;
    }

    DrawRectangleRec(track, SLIDER_TRACK);
    DrawRectangleRec({x, track_y, w * norm, SLIDER_HEIGHT}, SLIDER_FILL);
    float handle_x = x + w * norm - 4.0f;
    DrawRectangleRec({handle_x, track_y - 2.0f, 8.0f, SLIDER_HEIGHT + 4.0f}, SLIDER_HANDLE);

    char val_str[16];
    std::snprintf(val_str, sizeof(val_str), "%.1fs", static_cast<double>(value));
    DrawText(val_str, static_cast<int>(x + w + 8.0f), static_cast<int>(track_y + 2.0f),
             FONT_SIZE_SMALL, TEXT_COLOR);

    return changed;
}

} // namespace

void ControlState::set_ticket(const std::string& ticket) {
    std::size_t n = std::min(ticket.size(), sizeof(ticket_buf) - 1);
    std::memcpy(ticket_buf, ticket.data(), n);
    ticket_buf[n] = '\0';
    ticket_cursor = static_cast<int>(n);
}

ControlPanelResult draw_control_panel(ControlState& state, const char* roster_label, bool spinning,
                                      float panel_x, float panel_y, float panel_w) {
    ControlPanelResult result;
    ControlAction& action = result.action;

    // Measure the panel's height from the control stack so callers can place
    // the next panel below it
    float measure_y = panel_y + PADDING;
    measure_y += ROW_HEIGHT;                            // Title row
    measure_y += ROW_HEIGHT + ROW_GAP;                  // Ticket field
    measure_y += ROW_HEIGHT + SLIDER_HEIGHT + ROW_GAP;  // Duration slider
    measure_y += BUTTON_HEIGHT + ROW_GAP;               // Spin | Cancel
    measure_y += BUTTON_HEIGHT;                         // Random | Roster
    result.panel_height = (measure_y + PADDING) - panel_y;

    float content_w = panel_w - 2.0f * PADDING;
    float cx = panel_x + PADDING;
    float cy = panel_y + PADDING;

    DrawRectangleRec({panel_x, panel_y, panel_w, result.panel_height}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, result.panel_height}, 1.0f, BORDER_COLOR);

    DrawText("DRAW", static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += ROW_HEIGHT;

    draw_text_field("Ticket:", state.ticket_buf, static_cast<int>(sizeof(state.ticket_buf)),
                    state.ticket_cursor, state.editing_ticket, cx, cy, content_w);
    cy += ROW_HEIGHT + ROW_GAP;

    state.duration_s = std::clamp(state.duration_s, MIN_DURATION_S, MAX_DURATION_S);
    (void)draw_slider("Spin duration", state.duration_s, MIN_DURATION_S, MAX_DURATION_S,
                      state.dragging_duration, cx, cy, content_w - SLIDER_VALUE_WIDTH);
    cy += ROW_HEIGHT + SLIDER_HEIGHT + ROW_GAP;

    float half_w = (content_w - BUTTON_GAP) / 2.0f;
    if (draw_button("Spin", cx, cy, half_w, BUTTON_HEIGHT, BUTTON_BG_SPIN, !spinning)) {
        action.spin_pressed = true;
    }
    if (draw_button("Cancel", cx + half_w + BUTTON_GAP, cy, half_w, BUTTON_HEIGHT, BUTTON_BG_CANCEL,
                    spinning)) {
        action.cancel_pressed = true;
    }
    cy += BUTTON_HEIGHT + ROW_GAP;

    if (draw_button("Random ticket", cx, cy, half_w, BUTTON_HEIGHT, BUTTON_BG, !spinning)) {
        action.random_pressed = true;
    }
    if (draw_button(roster_label, cx + half_w + BUTTON_GAP, cy, half_w, BUTTON_HEIGHT, BUTTON_BG,
                    !spinning)) {
        action.roster_cycled = true;
    }

    return result;
}

} // namespace drawreel
