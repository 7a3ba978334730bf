#pragma once

#include <cstdint>
#include <optional>

#include "grid.hpp"

/**
 * @brief Startup parameters of an Engine and its initial grid.
 */
struct EngineConfig {
    /** @brief Largest accepted grid side */
    static constexpr std::uint32_t MAX_DIMENSION = 1u << 14;

    std::uint32_t width = 160;
    std::uint32_t height = 120;
    EdgePolicy edge = EdgePolicy::Clamp;
    /** @brief Start in Running (true) or Paused (false) */
    bool start_running = true;
    /** @brief Workers used by step; 1 = serial, 0 or -1 = one per spare core */
    int step_threads = 1;
    /** @brief Generations per second while running; 0 = one per tick */
    int target_tps = 0;
    /** @brief Initial random fill; 0 = start from the built-in pattern */
    double random_density = 0.0;
    /** @brief Seed for the initial fill; nullopt draws from random_device */
    std::optional<std::uint64_t> random_seed;
};

/**
 * @brief Checks every field of cfg.
 * @throws celleste::ConfigError naming the first invalid field
 */
void validate_config(const EngineConfig &cfg);
