#pragma once

#include <cstdint>

#include <raylib.h>

#include "irenderer.hpp"
#include "types/config.hpp"

/**
 * @brief Draws the current generation with the camera transform applied.
 *
 * Only the cells inside the visible window are visited, so panning across a
 * large grid costs the same as a small one. Grid lines are skipped when
 * zoomed out far enough for them to cover the cells.
 */
class GridRenderer : public IRenderer {
  public:
    GridRenderer() = default;
    ~GridRenderer() override = default;
    GridRenderer(const GridRenderer &) = delete;
    GridRenderer(GridRenderer &&) = delete;
    GridRenderer &operator=(const GridRenderer &) = delete;
    GridRenderer &operator=(GridRenderer &&) = delete;

    /**
     * @brief Draws into the current raylib frame; call between
     * BeginDrawing and EndDrawing.
     */
    void render(Context &ctx) override;

  private:
    /**
     * @brief Cell range [x0, x1) x [y0, y1) intersecting the screen
     */
    struct VisibleRange {
        std::uint32_t x0;
        std::uint32_t y0;
        std::uint32_t x1;
        std::uint32_t y1;
    };

    VisibleRange visible_range(const Context &ctx) const;
    void draw_cells(const Context &ctx, const VisibleRange &r) const;
    void draw_grid_lines(const Context &ctx, const VisibleRange &r) const;
    void draw_border(const Context &ctx) const;
};
