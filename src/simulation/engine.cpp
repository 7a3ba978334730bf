#include "engine.hpp"

#include <random>
#include <type_traits>
#include <utility>
#include <variant>

#include "../save_manager.hpp"

using namespace std::chrono;

const char *to_string(Engine::RunState state) noexcept {
    switch (state) {
    case Engine::RunState::Paused:
        return "paused";
    case Engine::RunState::Running:
        return "running";
    default:
        return "unknown";
    }
}

Engine::Engine(RuleSet rules, Grid grid, const EngineConfig &cfg)
    : m_rules(rules), m_grid(std::move(grid)),
      m_next(m_grid.width(), m_grid.height(), m_grid.edge_policy()) {
    validate_config(cfg);

    m_run_state = cfg.start_running ? RunState::Running : RunState::Paused;
    m_target_tps = cfg.target_tps;
    set_step_threads(cfg.step_threads);

    LOG_INFO("Engine ready: rule {}, {}x{} {} grid, {}, {} step thread(s)",
             m_rules.to_string(), m_grid.width(), m_grid.height(),
             to_string(m_grid.edge_policy()), to_string(m_run_state),
             step_threads());
}

void Engine::set_step_threads(int threads) {
    if (threads < -1) {
        throw celleste::ConfigError(
            fmt::format("Invalid thread count: {}", threads));
    }

    // the old workers are joined before the new pool starts
    m_pool.reset();
    if (threads == 1) {
        return;
    }

    auto pool = std::make_unique<StepThreadPool>(threads);
    if (pool->size() > 1) {
        m_pool = std::move(pool);
    }
}

void Engine::set_target_tps(int tps) {
    if (tps < 0) {
        throw celleste::ConfigError(
            fmt::format("Invalid generation rate: {}", tps));
    }
    m_target_tps = tps;
    m_last_tick.reset();
}

void Engine::step_rows(int row_begin, int row_end) {
    const std::uint32_t width = m_grid.width();

    for (int row = row_begin; row < row_end; ++row) {
        const auto y = std::uint32_t(row);
        for (std::uint32_t x = 0; x < width; ++x) {
            const bool alive = m_grid.at(x, y);
            const int neighbors = m_grid.live_neighbors_at(x, y);
            m_next.put(x, y, m_rules.next_state(alive, neighbors));
        }
    }
}

void Engine::step() {
    const auto begin = steady_clock::now();

    if (!m_next.same_shape(m_grid)) {
        m_next = Grid(m_grid.width(), m_grid.height(), m_grid.edge_policy());
    }

    // every cell of m_next is overwritten, so it needs no clearing
    const int rows = int(m_grid.height());
    if (m_pool) {
        m_pool->parallel_for_n(
            [this](int s, int e) {
                step_rows(s, e);
            },
            rows);
    } else {
        step_rows(0, rows);
    }

    std::swap(m_grid, m_next);
    ++m_generation;

    m_last_step_time = duration_cast<nanoseconds>(steady_clock::now() - begin);
}

bool Engine::tick() {
    if (!is_running()) {
        return false;
    }
    step();
    return true;
}

bool Engine::tick(Clock::time_point now) {
    if (!is_running()) {
        return false;
    }

    if (m_target_tps > 0) {
        const auto interval = nanoseconds(1'000'000'000LL / m_target_tps);
        if (m_last_tick && now - *m_last_tick < interval) {
            return false;
        }
        m_last_tick = now;
    }

    step();
    return true;
}

void Engine::pause() noexcept {
    if (m_run_state != RunState::Paused) {
        LOG_DEBUG("Paused at generation {}", m_generation);
    }
    m_run_state = RunState::Paused;
}

void Engine::resume() noexcept {
    if (m_run_state != RunState::Running) {
        LOG_DEBUG("Resumed at generation {}", m_generation);
        m_last_tick.reset();
    }
    m_run_state = RunState::Running;
}

void Engine::toggle_running() noexcept {
    if (is_running()) {
        pause();
    } else {
        resume();
    }
}

void Engine::toggle_cell(std::int64_t x, std::int64_t y) {
    m_grid.toggle_cell(x, y);
}

void Engine::clear() noexcept {
    m_grid.clear();
    m_generation = 0;
}

void Engine::randomize(double density, std::optional<std::uint64_t> seed) {
    std::mt19937_64 rng{seed ? *seed : std::random_device{}()};
    m_grid.randomize(rng, density);
    m_generation = 0;
}

void Engine::replace_grid(Grid grid) {
    m_grid = std::move(grid);
    if (!m_next.same_shape(m_grid)) {
        m_next = Grid(m_grid.width(), m_grid.height(), m_grid.edge_policy());
    }
    m_generation = 0;
}

void Engine::save(SaveManager &saves, const std::string &path) const {
    saves.save_grid(path, m_grid, m_rules);
}

void Engine::load(SaveManager &saves, const std::string &path) {
    // decode fully before touching m_grid
    codec::Snapshot snapshot = saves.load_grid(path);

    if (snapshot.rule && *snapshot.rule != m_rules) {
        LOG_WARN("{} was saved under rule {}; keeping {}", path,
                 snapshot.rule->to_string(), m_rules.to_string());
    }

    replace_grid(std::move(snapshot.grid));
}

void Engine::execute(const command::Command &cmd, SaveManager &saves) {
    LOG_DEBUG("Command: {}", command::describe(cmd));

    std::visit(
        [&](auto &&c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, command::ToggleCell>) {
                toggle_cell(c.x, c.y);
            } else if constexpr (std::is_same_v<T, command::Pause>) {
                pause();
            } else if constexpr (std::is_same_v<T, command::Resume>) {
                resume();
            } else if constexpr (std::is_same_v<T, command::TogglePause>) {
                toggle_running();
            } else if constexpr (std::is_same_v<T, command::OneStep>) {
                step();
            } else if constexpr (std::is_same_v<T, command::Clear>) {
                clear();
            } else if constexpr (std::is_same_v<T, command::Randomize>) {
                randomize(c.density, c.seed);
            } else if constexpr (std::is_same_v<T, command::Save>) {
                save(saves, c.path);
            } else if constexpr (std::is_same_v<T, command::Load>) {
                load(saves, c.path);
            }
        },
        cmd);
}
