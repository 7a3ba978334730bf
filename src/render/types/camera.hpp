#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

/**
 * @brief Pan/zoom state of the grid view.
 *
 * World space is the grid laid out at one unit per cell pixel, origin at
 * the top-left corner of cell (0, 0). (x, y) is the world point shown at
 * the center of the screen.
 */
struct CameraState {
    static constexpr float MIN_ZOOM_LOG = -3.0f; // 0.125x
    static constexpr float MAX_ZOOM_LOG = 4.0f;  // 16x

    float x = 0.0f;
    float y = 0.0f;
    float zoom_log = 0.0f; // zoom = 2^zoom_log

    float zoom() const { return std::exp2(zoom_log); }

    /** @brief Moves the view by a screen-space delta */
    void pan(float dx, float dy) {
        const float z = zoom();
        x -= dx / z;
        y -= dy / z;
    }

    void zoom_by(float step) {
        zoom_log = std::clamp(zoom_log + step, MIN_ZOOM_LOG, MAX_ZOOM_LOG);
    }

    /** @brief Centers the view on a grid of width x height cells */
    void center_on(std::uint32_t width, std::uint32_t height,
                   float cell_size) {
        x = float(width) * cell_size * 0.5f;
        y = float(height) * cell_size * 0.5f;
    }

    float world_to_screen_x(float wx, int screen_w) const {
        return (wx - x) * zoom() + float(screen_w) * 0.5f;
    }

    float world_to_screen_y(float wy, int screen_h) const {
        return (wy - y) * zoom() + float(screen_h) * 0.5f;
    }

    /**
     * @brief Cell under a screen point. The result may lie outside the grid;
     * callers check it with Grid::in_bounds.
     */
    std::pair<std::int64_t, std::int64_t>
    screen_to_cell(float sx, float sy, int screen_w, int screen_h,
                   float cell_size) const {
        const float z = zoom();
        const float wx = (sx - float(screen_w) * 0.5f) / z + x;
        const float wy = (sy - float(screen_h) * 0.5f) / z + y;
        return {std::int64_t(std::floor(wx / cell_size)),
                std::int64_t(std::floor(wy / cell_size))};
    }
};
