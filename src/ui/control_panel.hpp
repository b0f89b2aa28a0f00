/// @file control_panel.hpp
/// @brief UI panel for draw controls: ticket entry, spin duration, Spin/Cancel buttons.
///
/// All UI is drawn using Raylib primitives (no raygui/ImGui). The panel
/// reports actions back to the caller so the main loop decides what to do
/// with the controller.

#pragma once

#include <raylib.h>

#include <string>

namespace drawreel {

/// Actions the control panel can request from the main loop
struct ControlAction {
    bool spin_pressed = false;
    bool cancel_pressed = false;
    bool random_pressed = false; ///< Fill the ticket field with a random participant
    bool roster_cycled = false;  ///< Switch to the next demo roster size
};

/// Result of drawing the control panel.
struct ControlPanelResult {
    ControlAction action;
    float panel_height = 0.0f;
};

/// Persistent UI state, kept across frames
struct ControlState {
    float duration_s = 5.0f; ///< Nominal spin length in seconds

    // Ticket field editing state
    bool editing_ticket = false;
    char ticket_buf[24] = "";
    int ticket_cursor = 0;

    // Slider drag state
    bool dragging_duration = false;

    /// Replaces the ticket field contents (truncated to fit)
    void set_ticket(const std::string& ticket);

    [[nodiscard]] std::string ticket() const { return ticket_buf; }
};

/// Draws the control panel and handles mouse/keyboard interaction.
/// @param state        Mutable UI state (persists across frames)
/// @param roster_label Text for the roster button, e.g. "5000 participants"
/// @param spinning     Whether a spin is running (Spin is shown disabled)
/// @param panel_x      Left edge of the panel in screen coordinates
/// @param panel_y      Top edge of the panel in screen coordinates
/// @param panel_w      Width of the panel
/// @return Actions and rendered panel height for panel stacking
ControlPanelResult draw_control_panel(ControlState& state, const char* roster_label, bool spinning,
                                      float panel_x, float panel_y, float panel_w);

} // namespace drawreel
