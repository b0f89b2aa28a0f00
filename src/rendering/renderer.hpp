/// @file renderer.hpp
/// @brief Drawing capability consumed by the frame loop

#pragma once

#include "rendering/theme.hpp"
#include "windowing/window.hpp"

namespace drawreel {

/// Draws the reel for one frame.
///
/// Implementations decide only *how* to draw. The scroll position and the
/// window are owned by the SpinController and must not be modified.
class Renderer {
  public:
    virtual ~Renderer() = default;

    /// @param scroll_position Un-normalized position from the controller
    /// @param window          Window currently on display
    /// @param theme           Colours and sizes
    virtual void draw(double scroll_position, const Window& window, const ThemeSettings& theme) = 0;
};

} // namespace drawreel
