/// @file main.cpp
/// @brief Drawreel entry point: interactive raffle reel
///
/// Loads a synthetic roster, lets the operator pick a ticket and spins the reel
/// onto it. The roster button cycles through sizes small enough to be padded
/// and large enough to need the winner-window swap.
/// Supports both native desktop and Emscripten/WASM builds.

#include "config/spin_config.hpp"
#include "participants/demo_roster.hpp"
#include "participants/participant_index.hpp"
#include "rendering/reel_renderer.hpp"
#include "rendering/theme.hpp"
#include "session/session_winners.hpp"
#include "timing/frame_stats.hpp"
#include "timing/spin_controller.hpp"
#include "ui/control_panel.hpp"
#include "ui/status_panel.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <memory>
#include <random>
#include <string>
#include <utility>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr float UI_PANEL_WIDTH = 300.0f;
constexpr float UI_MARGIN = 10.0f;
constexpr float TITLE_HEIGHT = 48.0f;
constexpr float MAX_REEL_WIDTH = 520.0f;
constexpr double SLOW_FPS = 50.0;

constexpr std::array<std::size_t, 4> ROSTER_SIZES = {10, 50, 5000, 20000};

/// Holds the roster and controller; rebuilt when the roster size changes.
/// The controller refers to the index, so it is declared (and destroyed) after it.
/// Session winners outlive roster reloads.
struct AppState {
    std::unique_ptr<drawreel::ParticipantIndex> index;
    std::unique_ptr<drawreel::SpinController> controller;
    drawreel::SessionWinners winners;
    std::size_t roster_choice = 2;
    std::string message;
    std::mt19937 rng{std::random_device{}()};
};

/// Spin tunables for this build
drawreel::SpinConfig make_config() {
    drawreel::SpinConfig config;
#ifdef __EMSCRIPTEN__
    // No pthreads in the default WASM build; the winner window is built at the swap
    config.prefetch_winner_window = false;
#endif
    return config;
}

/// Builds (or rebuilds) the roster, index and controller for the current roster choice.
void rebuild_app_state(AppState& app) {
    // Controller first: it refers to the index being replaced
    app.controller.reset();

    std::size_t count = ROSTER_SIZES[app.roster_choice];
    app.index = std::make_unique<drawreel::ParticipantIndex>(
        drawreel::ParticipantIndex::build(drawreel::build_demo_roster(count, app.rng())));
    app.controller = std::make_unique<drawreel::SpinController>(*app.index, make_config(), app.rng());

    drawreel::SpinCallbacks callbacks;
    callbacks.on_complete = [&app](const drawreel::Participant& winner) {
        app.winners.record(winner, std::to_string(app.index->size()) + " participants",
                           drawreel::WallClock::now());
        app.message = "Winner: " + winner.display_name() + " (#" + winner.ticket_number + ")";
        std::fprintf(stderr, "[drawreel] %s\n", app.message.c_str());
    };
    callbacks.on_error = [&app](const std::string& reason) { app.message = reason; };
    app.controller->set_callbacks(std::move(callbacks));

    app.message.clear();
    std::fprintf(stderr, "[drawreel] Loaded %zu participants.\n", app.index->size());
}

/// Ticket of a uniformly chosen participant
std::string random_ticket(AppState& app) {
    if (app.index->empty()) {
        return "";
    }
    std::uniform_int_distribution<std::size_t> pick(0, app.index->size() - 1);
    return app.index->at(pick(app.rng)).ticket_number;
}

/// Reel viewport: left of the UI panels, slot count scaled to fit the height
Rectangle reel_viewport(const drawreel::ThemeSettings& theme) {
    float screen_w = static_cast<float>(GetScreenWidth());
    float screen_h = static_cast<float>(GetScreenHeight());

    float area_w = screen_w - UI_PANEL_WIDTH - 3.0f * UI_MARGIN;
    float area_h = screen_h - TITLE_HEIGHT - 2.0f * UI_MARGIN;

    float w = std::min(area_w, MAX_REEL_WIDTH);
    // Whole slots only, so the winner line sits exactly on a slot boundary
    float slot_h = std::floor(area_h / static_cast<float>(theme.visible_slots));
    float h = slot_h * static_cast<float>(theme.visible_slots);

    return {UI_MARGIN + (area_w - w) / 2.0f, TITLE_HEIGHT + (area_h - h) / 2.0f, w, h};
}

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    drawreel::ControlState ui;
    AppState app;
    drawreel::ThemeSettings theme;
    drawreel::FrameStats frames;
    std::unique_ptr<drawreel::ReelRenderer> renderer;
    bool slow_warned = false;
};

void start_spin(FrameState& state, double now_ms) {
    auto& app = state.app;
    drawreel::SpinRequest request{state.ui.ticket(), static_cast<double>(state.ui.duration_s) * 1000.0};
    if (app.controller->spin(request, now_ms) == drawreel::SpinStart::STARTED) {
        app.message.clear();
        state.frames.reset();
        state.slow_warned = false;
    }
}

/// One frame of the application, called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    auto& ui = state.ui;
    auto& app = state.app;
    const double now_ms = GetTime() * 1000.0;

    state.frames.record(static_cast<double>(GetFrameTime()) * 1000.0);
    if (app.controller->state() == drawreel::SpinState::SPINNING && !state.slow_warned &&
        state.frames.metrics().total_frames > static_cast<std::size_t>(TARGET_FPS) &&
        state.frames.below(SLOW_FPS)) {
        std::fprintf(stderr, "[drawreel] Frame rate dropped to %.0f fps during the spin.\n",
                     state.frames.metrics().average_fps);
        state.slow_warned = true;
    }

    int screen_w = GetScreenWidth();

    // --- Handle keyboard shortcuts (only when not editing the ticket field) ---
    if (!ui.editing_ticket) {
        if (IsKeyPressed(KEY_SPACE)) {
            start_spin(state, now_ms);
        }
        if (IsKeyPressed(KEY_ESCAPE) || IsKeyPressed(KEY_C)) {
            app.controller->cancel();
        }
    }

    // --- Update animation ---
    app.controller->tick(now_ms);

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    state.renderer->set_viewport(reel_viewport(state.theme));
    if (app.controller->window()) {
        state.renderer->draw(app.controller->position(), *app.controller->window(), state.theme);
    }

    // Title
    const char* title = "RAFFLE DRAW";
    int title_width = MeasureText(title, 24);
    float reel_area_w = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;
    DrawText(title, static_cast<int>((reel_area_w - static_cast<float>(title_width)) / 2.0f), 12,
             24, {240, 240, 240, 255});

    // --- Right-side UI panels ---
    float panel_x = static_cast<float>(screen_w) - UI_PANEL_WIDTH - UI_MARGIN;
    bool spinning = app.controller->state() == drawreel::SpinState::SPINNING;

    std::string roster_label = std::to_string(app.index->size()) + " participants";
    drawreel::ControlPanelResult controls = drawreel::draw_control_panel(
        ui, roster_label.c_str(), spinning, panel_x, UI_MARGIN, UI_PANEL_WIDTH);

    (void)drawreel::draw_status_panel(*app.controller, state.frames.metrics(), app.winners,
                                      app.message, now_ms, panel_x,
                                      UI_MARGIN + controls.panel_height + UI_MARGIN,
                                      UI_PANEL_WIDTH);

    DrawText("Space: spin   Esc/C: cancel", 10, GetScreenHeight() - 24, 13, {140, 140, 140, 255});

    EndDrawing();

    // --- Process UI actions (take effect next frame) ---
    const drawreel::ControlAction& action = controls.action;
    if (action.cancel_pressed) {
        app.controller->cancel();
    }
    if (action.random_pressed) {
        ui.set_ticket(random_ticket(app));
    }
    if (action.roster_cycled) {
        app.roster_choice = (app.roster_choice + 1) % ROSTER_SIZES.size();
        rebuild_app_state(app);
        ui.set_ticket(random_ticket(app));
    }
    if (action.spin_pressed) {
        start_spin(state, now_ms);
    }
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback, unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Drawreel - Raffle Draw");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);
    // Escape cancels a spin instead of closing the window
    SetExitKey(KEY_NULL);

    // --- Create all mutable state ---
    FrameState state;
    rebuild_app_state(state.app);
    state.ui.set_ticket(random_ticket(state.app));
    state.renderer = std::make_unique<drawreel::ReelRenderer>(state.app.controller->config());

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop; state is passed via void*.
    // 0 = use requestAnimationFrame (browser-native vsync), 1 = simulate infinite loop.
    emscripten_set_main_loop_arg(emscripten_frame, &state, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(state);
    }
#endif

    // Stop any spin before the roster goes away
    state.app.controller->cancel();
    CloseWindow();
    return 0;
}
