#include "grid_renderer.hpp"

#include <algorithm>
#include <cmath>

void GridRenderer::render(Context &ctx) {
    const VisibleRange r = visible_range(ctx);
    if (r.x0 >= r.x1 || r.y0 >= r.y1) {
        draw_border(ctx);
        return;
    }

    draw_cells(ctx, r);

    const float cell_px = ctx.rcfg.cell_size * ctx.rcfg.camera.zoom();
    if (ctx.rcfg.show_grid_lines && cell_px >= ctx.rcfg.min_line_px) {
        draw_grid_lines(ctx, r);
    }
    draw_border(ctx);
}

GridRenderer::VisibleRange
GridRenderer::visible_range(const Context &ctx) const {
    const Grid &grid = ctx.engine.grid();
    const auto &cam = ctx.rcfg.camera;
    const int sw = ctx.wcfg.screen_width;
    const int sh = ctx.wcfg.screen_height;
    const float cs = ctx.rcfg.cell_size;

    const auto top_left = cam.screen_to_cell(0.0f, 0.0f, sw, sh, cs);
    const auto bottom_right =
        cam.screen_to_cell(float(sw), float(sh), sw, sh, cs);

    auto clamp_to = [](std::int64_t v, std::uint32_t hi) {
        return std::uint32_t(std::clamp<std::int64_t>(v, 0, hi));
    };

    return {clamp_to(top_left.first, grid.width()),
            clamp_to(top_left.second, grid.height()),
            clamp_to(bottom_right.first + 1, grid.width()),
            clamp_to(bottom_right.second + 1, grid.height())};
}

void GridRenderer::draw_cells(const Context &ctx,
                              const VisibleRange &r) const {
    const Grid &grid = ctx.engine.grid();
    const auto &cam = ctx.rcfg.camera;
    const int sw = ctx.wcfg.screen_width;
    const int sh = ctx.wcfg.screen_height;
    const float cs = ctx.rcfg.cell_size;
    // at least one pixel so zoomed-out cells stay visible
    const float size = std::max(1.0f, cs * cam.zoom());

    for (std::uint32_t y = r.y0; y < r.y1; ++y) {
        const float sy = cam.world_to_screen_y(float(y) * cs, sh);
        for (std::uint32_t x = r.x0; x < r.x1; ++x) {
            if (!grid.at(x, y)) {
                continue;
            }
            const float sx = cam.world_to_screen_x(float(x) * cs, sw);
            DrawRectangleV(Vector2{sx, sy}, Vector2{size, size},
                           ctx.rcfg.alive_color);
        }
    }
}

void GridRenderer::draw_grid_lines(const Context &ctx,
                                   const VisibleRange &r) const {
    const auto &cam = ctx.rcfg.camera;
    const int sw = ctx.wcfg.screen_width;
    const int sh = ctx.wcfg.screen_height;
    const float cs = ctx.rcfg.cell_size;

    const float top = cam.world_to_screen_y(float(r.y0) * cs, sh);
    const float bottom = cam.world_to_screen_y(float(r.y1) * cs, sh);
    const float left = cam.world_to_screen_x(float(r.x0) * cs, sw);
    const float right = cam.world_to_screen_x(float(r.x1) * cs, sw);

    for (std::uint32_t x = r.x0; x <= r.x1; ++x) {
        const float sx = cam.world_to_screen_x(float(x) * cs, sw);
        DrawLineV(Vector2{sx, top}, Vector2{sx, bottom},
                  ctx.rcfg.grid_line_color);
    }
    for (std::uint32_t y = r.y0; y <= r.y1; ++y) {
        const float sy = cam.world_to_screen_y(float(y) * cs, sh);
        DrawLineV(Vector2{left, sy}, Vector2{right, sy},
                  ctx.rcfg.grid_line_color);
    }
}

void GridRenderer::draw_border(const Context &ctx) const {
    if (!ctx.rcfg.border_enabled) {
        return;
    }

    const Grid &grid = ctx.engine.grid();
    const auto &cam = ctx.rcfg.camera;
    const float cs = ctx.rcfg.cell_size;

    const float x0 = cam.world_to_screen_x(0.0f, ctx.wcfg.screen_width);
    const float y0 = cam.world_to_screen_y(0.0f, ctx.wcfg.screen_height);
    const float w = float(grid.width()) * cs * cam.zoom();
    const float h = float(grid.height()) * cs * cam.zoom();

    DrawRectangleLinesEx(Rectangle{x0 - 1.0f, y0 - 1.0f, w + 2.0f, h + 2.0f},
                         1.0f, ctx.rcfg.border_color);
}
