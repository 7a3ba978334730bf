#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../codec/grid_codec.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "command.hpp"
#include "engine_config.hpp"
#include "grid.hpp"
#include "multicore.hpp"
#include "ruleset.hpp"

class SaveManager;

/**
 * @brief Owns the rule and the current generation, and advances it.
 *
 * The engine is driven by the frame loop: edits and other input events go
 * through execute(), and tick() advances one generation while running. The
 * grid is double-buffered: step() reads the current grid, writes every cell
 * of the scratch grid and swaps the two, so no update sees a cell that was
 * already updated in the same generation.
 */
class Engine {
  public:
    /**
     * @brief Engine execution states
     */
    enum class RunState { Paused, Running };

    using Clock = std::chrono::steady_clock;

  public:
    /**
     * @param rules Rule, fixed for the lifetime of the engine
     * @param grid Initial generation
     * @param cfg Run state, step threads and tick rate (grid fields unused)
     * @throws celleste::ConfigError if cfg is invalid
     */
    Engine(RuleSet rules, Grid grid, const EngineConfig &cfg = {});
    ~Engine() = default;
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(Engine &&) = delete;

    /**
     * @brief Computes the next generation from the current one.
     */
    void step();

    /**
     * @brief One loop tick: steps once if running.
     * @return True if a generation was computed
     */
    bool tick();

    /**
     * @brief Rate-limited tick: steps once if running and at least
     * 1/target_tps seconds passed since the last stepping tick.
     * @return True if a generation was computed
     */
    bool tick(Clock::time_point now);

    void pause() noexcept;
    void resume() noexcept;
    void toggle_running() noexcept;

    /**
     * @brief Flips one cell; allowed while running and while paused.
     * @throws celleste::OutOfBoundsError
     */
    void toggle_cell(std::int64_t x, std::int64_t y);

    /** @brief Kills every cell and resets the generation counter */
    void clear() noexcept;

    /**
     * @brief Refills the grid at random and resets the generation counter.
     * @throws celleste::ConfigError if density is outside [0, 1]
     */
    void randomize(double density,
                   std::optional<std::uint64_t> seed = std::nullopt);

    /**
     * @brief Replaces the current generation wholesale (dimensions and edge
     * policy included) and resets the generation counter.
     */
    void replace_grid(Grid grid);

    /**
     * @brief Writes the current generation and rule to a save file.
     * @throws celleste::IOError
     */
    void save(SaveManager &saves, const std::string &path) const;

    /**
     * @brief Loads a save file into the engine. On any error the current
     * grid is left untouched.
     * @throws celleste::IOError
     * @throws celleste::MalformedSaveError
     */
    void load(SaveManager &saves, const std::string &path);

    /**
     * @brief Applies one input event.
     * @throws whatever the mapped operation throws
     */
    void execute(const command::Command &cmd, SaveManager &saves);

    /**
     * @brief Changes the number of step workers.
     * @param threads 1 = serial, 0 or -1 = one per spare core
     * @throws celleste::ConfigError if threads < -1
     * @throws celleste::SimulationError if the workers cannot be started
     */
    void set_step_threads(int threads);

    /**
     * @brief Changes the generation rate cap.
     * @throws celleste::ConfigError if tps is negative
     */
    void set_target_tps(int tps);

  public:
    inline const RuleSet &rules() const noexcept { return m_rules; }
    inline const Grid &grid() const noexcept { return m_grid; }
    inline RunState run_state() const noexcept { return m_run_state; }
    inline bool is_running() const noexcept {
        return m_run_state == RunState::Running;
    }
    inline std::uint64_t generation() const noexcept { return m_generation; }
    inline int step_threads() const noexcept {
        return m_pool ? m_pool->size() : 1;
    }
    inline int target_tps() const noexcept { return m_target_tps; }

    /** @brief Duration of the last step */
    inline std::chrono::nanoseconds last_step_time() const noexcept {
        return m_last_step_time;
    }

  private:
    /**
     * @brief Computes rows [row_begin, row_end) of the scratch grid
     */
    void step_rows(int row_begin, int row_end);

  private:
    /** @brief Rule, never replaced */
    const RuleSet m_rules;
    /** @brief Current generation */
    Grid m_grid;
    /** @brief Scratch generation written by step, same shape as m_grid */
    Grid m_next;
    /** @brief Step workers; null when stepping serially */
    std::unique_ptr<StepThreadPool> m_pool;

    RunState m_run_state{RunState::Paused};
    std::uint64_t m_generation{0};
    int m_target_tps{0};
    std::optional<Clock::time_point> m_last_tick;
    std::chrono::nanoseconds m_last_step_time{0};
};

const char *to_string(Engine::RunState state) noexcept;
