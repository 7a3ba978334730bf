#include <iostream>
#include <string>
#include <variant>

#include <fmt/format.h>
#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "cli/options.hpp"
#include "input/key_manager.hpp"
#include "input/keys.hpp"
#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "render/types/context.hpp"
#include "save_manager.hpp"
#include "simulation/command.hpp"
#include "simulation/engine.hpp"
#include "utility/default_pattern.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

namespace {

/**
 * @brief Runs every queued command; a failing command is reported in the
 * status line and the rest still run.
 */
void execute_commands(Engine &engine, command::Queue &commands,
                      SaveManager &saves, std::string &status) {
    for (const auto &cmd : commands.drain()) {
        try {
            engine.execute(cmd, saves);
            if (std::holds_alternative<command::Save>(cmd) ||
                std::holds_alternative<command::Load>(cmd)) {
                status = fmt::format("{}: ok", command::describe(cmd));
                LOG_INFO("{}", status);
            }
        } catch (const celleste::CellesteException &e) {
            status = fmt::format("{} failed: {}", command::describe(cmd),
                                 e.what());
            LOG_ERROR("{}", status);
        }
    }
}

/**
 * @brief Left drag pans, wheel zooms, right click toggles the cell under the
 * cursor. Clicks outside the grid are ignored.
 */
void handle_mouse(const Engine &engine, command::Queue &commands, Config &rcfg,
                  const WindowConfig &wcfg, bool mouse_captured) {
    if (mouse_captured) {
        return;
    }

    if (IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        const Vector2 delta = GetMouseDelta();
        rcfg.camera.pan(delta.x, delta.y);
    }

    const float wheel = GetMouseWheelMove();
    if (wheel != 0) {
        rcfg.camera.zoom_by(0.1f * wheel);
    }

    if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
        const Vector2 mouse = GetMousePosition();
        const auto [x, y] = rcfg.camera.screen_to_cell(
            mouse.x, mouse.y, wcfg.screen_width, wcfg.screen_height,
            rcfg.cell_size);
        if (engine.grid().in_bounds(x, y)) {
            commands.push(command::ToggleCell{x, y});
        }
    }
}

int run(int argc, char **argv) {
    const cli::AppOptions opt = cli::parse_options(argc, argv);
    if (opt.show_help) {
        std::cout << cli::usage(argv[0]);
        return 0;
    }

    const RuleSet rules = RuleSet::parse(opt.rules);

    LOG_INFO("Starting celleste");
    SaveManager saves;
    Engine engine(rules, celleste::utility::create_initial_grid(opt.engine),
                  opt.engine);

    std::string status;
    if (opt.load_file) {
        try {
            engine.load(saves, *opt.load_file);
            status = fmt::format("Loaded {}", *opt.load_file);
        } catch (const celleste::CodecError &e) {
            // keep the initial pattern, like a failed load from the UI
            status = fmt::format("Could not load {}: {}", *opt.load_file,
                                 e.what());
            LOG_ERROR("{}", status);
            std::cerr << status << std::endl;
        }
    }

    const auto window_state = saves.load_window_state();

    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(window_state.width, window_state.height, "Celleste");
    SetWindowPosition(window_state.x, window_state.y);
    SetTargetFPS(60);
    rlImGuiSetup(true);

    ImGui::GetIO().IniFilename = nullptr;

    WindowConfig wcfg = {GetScreenWidth(), GetScreenHeight()};
    Config rcfg;
    rcfg.camera.center_on(engine.grid().width(), engine.grid().height(),
                          rcfg.cell_size);
    if (opt.engine.random_density > 0.0) {
        rcfg.random_density = float(opt.engine.random_density);
    }

    RenderManager rman;
    command::Queue commands;
    KeyManager key_manager;
    bool should_exit = false;
    setup_keys(key_manager, engine, commands, rcfg, opt.save_file,
               should_exit);

    while (!should_exit && !WindowShouldClose()) {
        if (IsWindowResized()) {
            wcfg.screen_width = GetScreenWidth();
            wcfg.screen_height = GetScreenHeight();
            LOG_DEBUG("Window resized to {}x{}", wcfg.screen_width,
                      wcfg.screen_height);
        }

        execute_commands(engine, commands, saves, status);
        engine.tick(Engine::Clock::now());

        Context ctx{engine, commands, saves, rcfg, wcfg, opt.save_file, status};
        if (rman.draw_frame(ctx)) {
            break;
        }

        bool mouse_captured = false;
        bool keyboard_captured = false;
        if (rcfg.show_ui) {
            ImGuiIO &io = ImGui::GetIO();
            mouse_captured = io.WantCaptureMouse;
            keyboard_captured = io.WantCaptureKeyboard;
        }

        key_manager.process(keyboard_captured);
        handle_mouse(engine, commands, rcfg, wcfg, mouse_captured);
    }

    SaveManager::WindowState current_state;
    current_state.width = GetScreenWidth();
    current_state.height = GetScreenHeight();
    current_state.x = int(GetWindowPosition().x);
    current_state.y = int(GetWindowPosition().y);
    saves.save_window_state(current_state);

    rlImGuiShutdown();
    CloseWindow();
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    try {
        const int code = run(argc, argv);
        LOG_INFO("Application shutting down normally");
        return code;
    } catch (const celleste::RuleParseError &e) {
        std::cerr << "Error parsing rules: " << e.what() << std::endl;
        return 1;
    } catch (const celleste::ConfigError &e) {
        std::cerr << "Error: " << e.what() << "\n\n"
                  << cli::usage(argc > 0 ? argv[0] : "celleste");
        return 1;
    } catch (const celleste::CellesteException &e) {
        LOG_ERROR("Celleste error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: {}", e.what());
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
