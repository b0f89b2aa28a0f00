/// @file reel_renderer.hpp
/// @brief Raylib implementation of the reel Renderer

#pragma once

#include "config/spin_config.hpp"
#include "rendering/renderer.hpp"

#include <raylib.h>

namespace drawreel {

/// Draws the reel as a vertical strip of name/ticket slots inside a viewport,
/// with the winner line framed and soft shadows at the top and bottom edges.
///
/// Positions are in SpinConfig units; the renderer scales them so exactly
/// `theme.visible_slots` slots fill the viewport height.
class ReelRenderer final : public Renderer {
  public:
    explicit ReelRenderer(const SpinConfig& config);

    /// Screen-space rectangle the reel is drawn into
    void set_viewport(Rectangle viewport) { viewport_ = viewport; }
    [[nodiscard]] Rectangle viewport() const { return viewport_; }

    void draw(double scroll_position, const Window& window, const ThemeSettings& theme) override;

  private:
    double item_height_;
    int center_offset_;
    Rectangle viewport_ = {0.0f, 0.0f, 400.0f, 400.0f};
};

} // namespace drawreel
