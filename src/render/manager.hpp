#pragma once

#include <raylib.h>
#include <rlImGui.h>

#include "grid_renderer.hpp"
#include "types/context.hpp"
#include "ui/control_panel.hpp"

// Orchestrates one frame: grid first, ImGui on top.
class RenderManager {
  public:
    RenderManager() = default;
    ~RenderManager() = default;
    RenderManager(const RenderManager &) = delete;
    RenderManager &operator=(const RenderManager &) = delete;
    RenderManager(RenderManager &&) = delete;
    RenderManager &operator=(RenderManager &&) = delete;

    /**
     * @return True if a renderer asked the application to exit
     */
    bool draw_frame(Context &ctx) {
        BeginDrawing();
        ClearBackground(ctx.rcfg.background_color);

        m_grid.render(ctx);

        rlImGuiBegin();
        m_panel.render(ctx);
        rlImGuiEnd();

        EndDrawing();

        return ctx.should_exit;
    }

  private:
    GridRenderer m_grid;
    ControlPanel m_panel;
};
