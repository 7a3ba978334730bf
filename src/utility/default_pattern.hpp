#pragma once

#include <cstdint>
#include <random>

#include "../simulation/engine_config.hpp"
#include "../simulation/grid.hpp"
#include "logger.hpp"

namespace celleste::utility {

/**
 * @brief Glider offsets from the grid center; heads down and to the right.
 */
inline constexpr int DEFAULT_GLIDER[5][2] = {
    {0, 0}, {1, 0}, {2, 0}, {2, 1}, {1, 2}};

/**
 * @brief Stamps the built-in glider around the center of the grid. Cells
 * that do not fit are skipped.
 */
inline void place_default_pattern(Grid &grid) {
    const std::int64_t cx = std::int64_t(grid.width()) / 2 - 1;
    const std::int64_t cy = std::int64_t(grid.height()) / 2 - 1;

    for (const auto &cell : DEFAULT_GLIDER) {
        const std::int64_t x = cx + cell[0];
        const std::int64_t y = cy + cell[1];
        if (grid.in_bounds(x, y)) {
            grid.set(x, y, true);
        }
    }
}

/**
 * @brief Builds the first generation described by cfg: a random fill when
 * random_density > 0, the default glider otherwise.
 * @throws celleste::ConfigError if cfg is invalid
 */
inline Grid create_initial_grid(const EngineConfig &cfg) {
    validate_config(cfg);

    Grid grid(cfg.width, cfg.height, cfg.edge);
    if (cfg.random_density > 0.0) {
        std::mt19937_64 rng{cfg.random_seed ? *cfg.random_seed
                                            : std::random_device{}()};
        grid.randomize(rng, cfg.random_density);
    } else {
        place_default_pattern(grid);
    }

    LOG_DEBUG("Initial grid: {}x{}, {} live", grid.width(), grid.height(),
              grid.live_count());
    return grid;
}

} // namespace celleste::utility
