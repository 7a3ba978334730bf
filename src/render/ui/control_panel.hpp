#pragma once

#include <imgui.h>

#include "../irenderer.hpp"
#include "../types/config.hpp"

/**
 * @brief Main ImGui window: simulation state, actions, recent files and the
 * status line. Every action is pushed onto the command queue.
 */
class ControlPanel : public IRenderer {
  public:
    ControlPanel() = default;
    ~ControlPanel() override = default;
    ControlPanel(const ControlPanel &) = delete;
    ControlPanel &operator=(const ControlPanel &) = delete;
    ControlPanel(ControlPanel &&) = delete;
    ControlPanel &operator=(ControlPanel &&) = delete;

    /**
     * @brief Renders the panel if the UI is shown
     */
    void render(Context &ctx) override;

  private:
    void render_ui(Context &ctx);
    void render_state_section(Context &ctx);
    void render_actions_section(Context &ctx);
    void render_view_section(Context &ctx);
    void render_files_section(Context &ctx);
    void render_status_section(Context &ctx);
};
