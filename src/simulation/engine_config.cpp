#include "engine_config.hpp"

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

void validate_config(const EngineConfig &cfg) {
    if (cfg.width == 0 || cfg.height == 0 ||
        cfg.width > EngineConfig::MAX_DIMENSION ||
        cfg.height > EngineConfig::MAX_DIMENSION) {
        throw celleste::ConfigError(
            fmt::format("Invalid grid size {}x{} (each side 1-{})", cfg.width,
                        cfg.height, EngineConfig::MAX_DIMENSION));
    }

    if (cfg.edge != EdgePolicy::Clamp && cfg.edge != EdgePolicy::Wrap) {
        throw celleste::ConfigError("Invalid edge policy");
    }

    if (cfg.step_threads < -1) {
        throw celleste::ConfigError(
            fmt::format("Invalid thread count: {}", cfg.step_threads));
    }

    if (cfg.target_tps < 0) {
        throw celleste::ConfigError(
            fmt::format("Invalid generation rate: {}", cfg.target_tps));
    }

    if (!(cfg.random_density >= 0.0 && cfg.random_density <= 1.0)) {
        throw celleste::ConfigError(
            fmt::format("Invalid fill density: {}", cfg.random_density));
    }
}
