#include "keys.hpp"

#include "../utility/logger.hpp"

void setup_keys(KeyManager &key_manager, const Engine &engine,
                command::Queue &commands, Config &rcfg,
                const std::string &save_file, bool &should_exit) {
    key_manager.on_key_pressed(KEY_ESCAPE, [&should_exit]() {
        should_exit = true;
    }); // Esc

    // Simulation controls
    key_manager.on_key_pressed(KEY_SPACE, [&commands]() {
        commands.push(command::TogglePause{});
    }); // Space

    key_manager.on_key_pressed(KEY_N, [&commands]() {
        commands.push(command::OneStep{});
    }); // N

    key_manager.on_key_repeat(KEY_N, [&engine, &commands]() {
        if (!engine.is_running()) {
            commands.push(command::OneStep{});
        }
    }); // N (repeat when paused)

    key_manager.on_key_pressed(KEY_C, [&commands]() {
        commands.push(command::Clear{});
    }); // C

    key_manager.on_key_pressed(KEY_R, [&commands, &rcfg]() {
        commands.push(command::Randomize{rcfg.random_density, {}});
    }); // R

    // File operations
    key_manager.on_key_pressed(KEY_S, [&commands, &save_file]() {
        commands.push(command::Save{save_file});
    }); // S

    key_manager.on_key_pressed(KEY_L, [&commands, &save_file]() {
        commands.push(command::Load{save_file});
    }); // L

    // UI toggles
    key_manager.on_key_pressed(KEY_U, [&rcfg]() {
        rcfg.show_ui = !rcfg.show_ui;
    }); // U

    key_manager.on_key_pressed(KEY_G, [&rcfg]() {
        rcfg.show_grid_lines = !rcfg.show_grid_lines;
    }); // G

    // Camera controls, in screen pixels per frame
    static const float pan_speed = 10.0f;
    key_manager.on_key_down(KEY_LEFT, [&rcfg]() {
        rcfg.camera.pan(pan_speed, 0.0f);
    }); // Left arrow

    key_manager.on_key_down(KEY_RIGHT, [&rcfg]() {
        rcfg.camera.pan(-pan_speed, 0.0f);
    }); // Right arrow

    key_manager.on_key_down(KEY_UP, [&rcfg]() {
        rcfg.camera.pan(0.0f, pan_speed);
    }); // Up arrow

    key_manager.on_key_down(KEY_DOWN, [&rcfg]() {
        rcfg.camera.pan(0.0f, -pan_speed);
    }); // Down arrow

    static const float zoom_step = 0.1f;
    key_manager.on_key_pressed(KEY_MINUS, [&rcfg]() {
        rcfg.camera.zoom_by(-zoom_step);
    }); // -

    key_manager.on_key_pressed(KEY_EQUAL, [&rcfg]() {
        rcfg.camera.zoom_by(zoom_step);
    }); // =

    LOG_INFO("Keyboard shortcuts registered");
}
