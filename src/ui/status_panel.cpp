/// @file status_panel.cpp
/// @brief Implements the status panel readouts

#include "ui/status_panel.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <string>
#include <utility>

namespace drawreel {

namespace {

constexpr float PADDING = 10.0f;
constexpr float ROW_HEIGHT = 20.0f;
constexpr float TITLE_HEIGHT = 28.0f;
constexpr float SECTION_GAP = 8.0f;
constexpr float VALUE_X = 96.0f;
constexpr int FONT_SIZE = 16;
constexpr int FONT_SIZE_SMALL = 13;
constexpr float PROGRESS_HEIGHT = 8.0f;
constexpr double SLOW_FPS = 50.0;
constexpr std::size_t WINNER_ROWS = 5;
constexpr float TIME_COLUMN_W = 64.0f;

const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color STATE_IDLE = {150, 150, 170, 255};
const Color STATE_SPINNING = {60, 140, 200, 255};
const Color STATE_COMPLETED = {80, 220, 130, 255};
const Color STATE_CANCELLED = {220, 200, 120, 255};
const Color STATE_ERRORED = {235, 90, 90, 255};
const Color PROGRESS_TRACK = {50, 50, 60, 255};
const Color PROGRESS_FILL = {255, 215, 0, 255};
const Color FPS_OK = {80, 220, 100, 255};
const Color FPS_SLOW = {255, 160, 60, 255};

Color state_color(SpinState state) {
    switch (state) {
    case SpinState::IDLE:
        return STATE_IDLE;
    case SpinState::SPINNING:
        return STATE_SPINNING;
    case SpinState::COMPLETED:
        return STATE_COMPLETED;
    case SpinState::CANCELLED:
        return STATE_CANCELLED;
    case SpinState::ERRORED:
        return STATE_ERRORED;
    }
    return TEXT_COLOR;
}

/// Draws wrapped text and returns consumed height.
float draw_wrapped_text(const std::string& text, float x, float y, float max_width, int font_size,
                        Color color, float line_gap = 2.0f) {
    std::istringstream iss(text);
    std::string word;
    std::string line;
    float cy = y;

    while (iss >> word) {
        std::string candidate = line.empty() ? word : (line + " " + word);
        if (MeasureText(candidate.c_str(), font_size) <= static_cast<int>(max_width)) {
            line = std::move(candidate);
        } else {
            if (!line.empty()) {
                DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
                cy += static_cast<float>(font_size) + line_gap;
            }
            line = word;
        }
    }

    if (!line.empty()) {
        DrawText(line.c_str(), static_cast<int>(x), static_cast<int>(cy), font_size, color);
        cy += static_cast<float>(font_size);
    }

    return cy - y;
}

/// One "label  value" row
void draw_row(const char* label, const std::string& value, float x, float y, Color value_color) {
    DrawText(label, static_cast<int>(x), static_cast<int>(y), FONT_SIZE_SMALL, LABEL_COLOR);
    DrawText(value.c_str(), static_cast<int>(x + VALUE_X), static_cast<int>(y), FONT_SIZE_SMALL,
             value_color);
}

std::string window_summary(const WindowPtr& window) {
    if (!window || window->empty()) {
        return "-";
    }
    return std::to_string(window->size()) + " (#" + (*window)[0].ticket_number + " .. #" +
           (*window)[window->size() - 1].ticket_number + ")";
}

} // namespace

float draw_status_panel(const SpinController& controller, const FrameMetrics& frames,
                        const SessionWinners& winners, const std::string& message, double now_ms,
                        float panel_x, float panel_y, float panel_w) {
    float content_w = panel_w - 2.0f * PADDING;
    float cx = panel_x + PADDING;

    // Fixed row count, so the background can be drawn before the rows
    const int message_lines = message.empty() ? 0 : 3;
    const std::size_t winner_rows = std::max<std::size_t>(std::min(winners.size(), WINNER_ROWS), 1);
    float height = PADDING + TITLE_HEIGHT + 7.0f * ROW_HEIGHT + SECTION_GAP + PROGRESS_HEIGHT +
                   SECTION_GAP + static_cast<float>(message_lines) *
                                     (static_cast<float>(FONT_SIZE_SMALL) + 2.0f) +
                   SECTION_GAP + TITLE_HEIGHT + static_cast<float>(winner_rows) * ROW_HEIGHT +
                   PADDING;
    DrawRectangleRec({panel_x, panel_y, panel_w, height}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, height}, 1.0f, BORDER_COLOR);

    float cy = panel_y + PADDING;
    DrawText("STATUS", static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += TITLE_HEIGHT;

    SpinState state = controller.state();
    draw_row("State", std::string(spin_state_name(state)), cx, cy, state_color(state));
    cy += ROW_HEIGHT;

    draw_row("Last outcome", std::string(spin_state_name(controller.last_outcome())), cx, cy,
             state_color(controller.last_outcome()));
    cy += ROW_HEIGHT;

    draw_row("Participants", std::to_string(controller.index().size()), cx, cy, TEXT_COLOR);
    cy += ROW_HEIGHT;

    const std::string& target = controller.target_ticket();
    draw_row("Target", target.empty() ? "-" : "#" + target, cx, cy, TEXT_COLOR);
    cy += ROW_HEIGHT;

    std::string winner = "-";
    if (state == SpinState::COMPLETED && controller.winner() != nullptr) {
        winner = controller.winner()->display_name();
    }
    draw_row("Winner", winner, cx, cy, STATE_COMPLETED);
    cy += ROW_HEIGHT;

    draw_row("Window", window_summary(controller.window()), cx, cy, TEXT_COLOR);
    cy += ROW_HEIGHT;

    char fps_str[64];
    std::snprintf(fps_str, sizeof(fps_str), "%.0f avg / %zu dropped", frames.average_fps,
                  frames.dropped_frames);
    bool slow = frames.total_frames > 0 && frames.average_fps < SLOW_FPS;
    draw_row("Frame rate", fps_str, cx, cy, slow ? FPS_SLOW : FPS_OK);
    cy += ROW_HEIGHT + SECTION_GAP;

    // Spin progress; the bar fills to the nominal duration and the swap marker
    // shows whether the winner window is already on display
    float progress = 0.0f;
    bool swapped = false;
    if (const SpinPhysics* physics = controller.physics()) {
        progress = static_cast<float>(std::clamp(physics->spin_progress_at(now_ms), 0.0, 1.0));
        swapped = physics->state().has_retargeted;
    } else if (state == SpinState::COMPLETED || state == SpinState::ERRORED) {
        progress = 1.0f;
    }
    DrawRectangleRec({cx, cy, content_w, PROGRESS_HEIGHT}, PROGRESS_TRACK);
    DrawRectangleRec({cx, cy, content_w * progress, PROGRESS_HEIGHT},
                     swapped || progress >= 1.0f ? PROGRESS_FILL : STATE_SPINNING);
    cy += PROGRESS_HEIGHT + SECTION_GAP;

    if (!message.empty()) {
        Color color = state == SpinState::ERRORED ? STATE_ERRORED : TEXT_COLOR;
        (void)draw_wrapped_text(message, cx, cy, content_w, FONT_SIZE_SMALL, color);
        cy += static_cast<float>(message_lines) * (static_cast<float>(FONT_SIZE_SMALL) + 2.0f);
    }
    cy += SECTION_GAP;

    // --- Session winners ---
    std::string heading = "SESSION WINNERS (" + std::to_string(winners.total_drawn()) + ")";
    DrawText(heading.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE, TEXT_COLOR);
    cy += TITLE_HEIGHT;

    if (winners.empty()) {
        DrawText("No winners drawn yet", static_cast<int>(cx), static_cast<int>(cy),
                 FONT_SIZE_SMALL, LABEL_COLOR);
    }
    std::size_t shown = 0;
    for (const SessionWinner& entry : winners.entries()) {
        if (shown++ == WINNER_ROWS) {
            break;
        }
        std::string time = format_time_of_day(entry.drawn_at);
        DrawText(time.c_str(), static_cast<int>(cx), static_cast<int>(cy), FONT_SIZE_SMALL,
                 LABEL_COLOR);
        std::string who =
            "#" + entry.participant.ticket_number + "  " + entry.participant.display_name();
        DrawText(who.c_str(), static_cast<int>(cx + TIME_COLUMN_W), static_cast<int>(cy),
                 FONT_SIZE_SMALL, STATE_COMPLETED);
        cy += ROW_HEIGHT;
    }

    return height;
}

} // namespace drawreel
