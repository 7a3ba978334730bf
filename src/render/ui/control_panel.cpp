#include "control_panel.hpp"

#include <string>

#include <raylib.h>

void ControlPanel::render(Context &ctx) {
    if (!ctx.rcfg.show_ui) {
        return;
    }
    render_ui(ctx);
}

void ControlPanel::render_ui(Context &ctx) {
    ImGui::Begin("Celleste", &ctx.rcfg.show_ui);
    ImGui::SetWindowPos(ImVec2{10.f, 10.f}, ImGuiCond_FirstUseEver);
    ImGui::SetWindowSize(ImVec2{320, 460}, ImGuiCond_FirstUseEver);

    render_state_section(ctx);
    render_actions_section(ctx);
    render_view_section(ctx);
    render_files_section(ctx);
    render_status_section(ctx);

    ImGui::End();
}

void ControlPanel::render_state_section(Context &ctx) {
    const Engine &engine = ctx.engine;
    const Grid &grid = engine.grid();

    ImGui::SeparatorText("Simulation");
    ImGui::Text("Rule: %s", engine.rules().to_string().c_str());
    ImGui::Text("Grid: %u x %u (%s)", grid.width(), grid.height(),
                to_string(grid.edge_policy()));
    ImGui::Text("State: %s", to_string(engine.run_state()));
    ImGui::Text("Generation: %llu", (unsigned long long)engine.generation());
    ImGui::Text("Live cells: %zu", grid.live_count());
    ImGui::Text("Last step: %.3f ms", engine.last_step_time().count() / 1e6);
    ImGui::Text("Step threads: %d  FPS: %d", engine.step_threads(), GetFPS());
}

void ControlPanel::render_actions_section(Context &ctx) {
    ImGui::SeparatorText("Actions");

    const char *run_label = ctx.engine.is_running() ? "Pause" : "Resume";
    if (ImGui::Button(run_label)) {
        ctx.commands.push(command::TogglePause{});
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(ctx.engine.is_running());
    if (ImGui::Button("Step")) {
        ctx.commands.push(command::OneStep{});
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        ctx.commands.push(command::Clear{});
    }

    ImGui::SliderFloat("Density", &ctx.rcfg.random_density, 0.0f, 1.0f,
                       "%.2f");
    if (ImGui::Button("Randomize")) {
        ctx.commands.push(command::Randomize{ctx.rcfg.random_density, {}});
    }

    if (ImGui::Button("Save")) {
        ctx.commands.push(command::Save{ctx.save_file});
    }
    ImGui::SameLine();
    if (ImGui::Button("Load")) {
        ctx.commands.push(command::Load{ctx.save_file});
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", ctx.save_file.c_str());
}

void ControlPanel::render_view_section(Context &ctx) {
    auto &cam = ctx.rcfg.camera;

    ImGui::SeparatorText("View");
    ImGui::Text("Zoom: %.2fx", cam.zoom());
    ImGui::SameLine();
    if (ImGui::Button("Reset view")) {
        cam.zoom_log = 0.0f;
        cam.center_on(ctx.engine.grid().width(), ctx.engine.grid().height(),
                      ctx.rcfg.cell_size);
    }
    ImGui::Checkbox("Grid lines", &ctx.rcfg.show_grid_lines);
    ImGui::SameLine();
    ImGui::Checkbox("Border", &ctx.rcfg.border_enabled);
}

void ControlPanel::render_files_section(Context &ctx) {
    if (!ImGui::CollapsingHeader("Recent files")) {
        return;
    }

    const auto recent = ctx.save.get_recent_files();
    if (recent.empty()) {
        ImGui::TextDisabled("(none)");
        return;
    }

    for (const std::string &path : recent) {
        if (ImGui::Selectable(path.c_str())) {
            ctx.commands.push(command::Load{path});
        }
    }
    if (ImGui::SmallButton("Clear list")) {
        ctx.save.clear_recent_files();
    }
}

void ControlPanel::render_status_section(Context &ctx) {
    if (ctx.status.empty()) {
        return;
    }
    ImGui::SeparatorText("Status");
    ImGui::TextWrapped("%s", ctx.status.c_str());
}
