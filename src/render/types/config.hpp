#pragma once

#include <raylib.h>

#include "camera.hpp"

/**
 * @brief Window configuration structure containing basic window dimensions
 */
struct WindowConfig {
    int screen_width;  ///< Screen width in pixels
    int screen_height; ///< Screen height in pixels
};

struct Config {
    // ui
    bool show_ui = true;

    // cells
    float cell_size = 8.0f; // world units per cell
    Color alive_color = {235, 235, 235, 255};
    Color background_color = {0, 0, 0, 255};

    // grid lines, drawn only once a cell covers min_line_px pixels
    bool show_grid_lines = true;
    Color grid_line_color = {40, 40, 40, 255};
    float min_line_px = 6.0f;

    // border
    bool border_enabled = true;
    Color border_color = {90, 90, 110, 255};

    // density used by the randomize key and button
    float random_density = 0.25f;

    // camera
    CameraState camera;
};
