/// @file status_panel.hpp
/// @brief Status panel showing spin state, winner, window contents and frame rate.

#pragma once

#include "session/session_winners.hpp"
#include "timing/frame_stats.hpp"
#include "timing/spin_controller.hpp"

#include <raylib.h>

#include <string>

namespace drawreel {

/// Draws the status panel showing:
/// - Controller state and the outcome of the last spin
/// - Target ticket, and the winner once a spin completes
/// - Window size and its first/last tickets (changes at the swap)
/// - Frame rate and dropped frames
/// - The most recent winners of this session, with the time they were drawn
/// @param controller The controller being visualized
/// @param frames     Frame statistics for the current session
/// @param winners    Winners drawn so far, newest first
/// @param message    Last completion or error message ("" for none)
/// @param now_ms     Current timestamp, for spin progress
/// @param panel_x    Left edge of panel in screen coords
/// @param panel_y    Top edge of panel in screen coords
/// @param panel_w    Width of the panel
/// @return Rendered panel height, for stacking.
float draw_status_panel(const SpinController& controller, const FrameMetrics& frames,
                        const SessionWinners& winners, const std::string& message, double now_ms,
                        float panel_x, float panel_y, float panel_w);

} // namespace drawreel
