#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

#include "../utility/exceptions.hpp"

/**
 * @brief How neighbors outside the grid are treated.
 */
enum class EdgePolicy : std::uint8_t {
    Clamp = 0, ///< Cells outside the grid count as dead
    Wrap = 1   ///< Toroidal: coordinates wrap modulo width/height
};

const char *to_string(EdgePolicy edge) noexcept;

/**
 * @brief Fixed-size 2D field of alive/dead cells.
 *
 * Cells are stored row-major, one byte per cell, so disjoint rows can be
 * written from different threads. The edge policy is fixed at construction
 * and applies to every neighbor count made on this grid.
 */
class Grid {
  public:
    /** @brief Seeds one cell at construction time */
    using CellInit = std::function<bool(std::uint32_t x, std::uint32_t y)>;

    /**
     * @brief Creates an all-dead grid.
     * @throws celleste::ConfigError if width or height is zero
     */
    Grid(std::uint32_t width, std::uint32_t height,
         EdgePolicy edge = EdgePolicy::Clamp);

    /**
     * @brief Creates a grid whose cell (x, y) is initial(x, y).
     * @throws celleste::ConfigError if width or height is zero
     */
    Grid(std::uint32_t width, std::uint32_t height, EdgePolicy edge,
         const CellInit &initial);

    inline std::uint32_t width() const noexcept { return m_width; }
    inline std::uint32_t height() const noexcept { return m_height; }
    inline EdgePolicy edge_policy() const noexcept { return m_edge; }
    inline std::size_t size() const noexcept { return m_cells.size(); }

    inline bool in_bounds(std::int64_t x, std::int64_t y) const noexcept {
        return x >= 0 && y >= 0 && x < std::int64_t(m_width) &&
               y < std::int64_t(m_height);
    }

    /**
     * @throws celleste::OutOfBoundsError
     */
    bool get(std::int64_t x, std::int64_t y) const;

    /**
     * @throws celleste::OutOfBoundsError
     */
    void set(std::int64_t x, std::int64_t y, bool alive);

    /**
     * @brief Flips one cell. Neighbor counts see the change immediately, the
     * engine only on its next step.
     * @throws celleste::OutOfBoundsError
     */
    void toggle_cell(std::int64_t x, std::int64_t y);

    /**
     * @brief Live cells among the 8 neighbors of (x, y) under the edge policy.
     * @throws celleste::OutOfBoundsError if (x, y) itself is off the grid
     */
    std::uint8_t count_live_neighbors(std::int64_t x, std::int64_t y) const;

    /**
     * @brief Unchecked neighbor count for the step loop; (x, y) must be on
     * the grid.
     */
    std::uint8_t live_neighbors_at(std::uint32_t x,
                                   std::uint32_t y) const noexcept;

    /** @brief Unchecked read */
    inline bool at(std::uint32_t x, std::uint32_t y) const noexcept {
        return m_cells[index_of(x, y)] != 0;
    }

    /** @brief Unchecked write */
    inline void put(std::uint32_t x, std::uint32_t y, bool alive) noexcept {
        m_cells[index_of(x, y)] = alive ? 1 : 0;
    }

    /** @brief Kills every cell */
    void clear() noexcept;

    /**
     * @brief Sets every cell alive with probability density.
     * @throws celleste::ConfigError if density is outside [0, 1]
     */
    void randomize(std::mt19937_64 &rng, double density);

    /** @brief Number of live cells */
    std::size_t live_count() const noexcept;

    /** @brief Row-major cell bytes, 0 = dead, 1 = alive */
    inline const std::vector<std::uint8_t> &cells() const noexcept {
        return m_cells;
    }

    /** @brief Same dimensions and edge policy */
    inline bool same_shape(const Grid &other) const noexcept {
        return m_width == other.m_width && m_height == other.m_height &&
               m_edge == other.m_edge;
    }

    friend bool operator==(const Grid &, const Grid &) = default;

  private:
    inline std::size_t index_of(std::uint32_t x,
                                std::uint32_t y) const noexcept {
        return std::size_t(y) * m_width + x;
    }

    void check_bounds(std::int64_t x, std::int64_t y) const;

    std::uint32_t m_width;
    std::uint32_t m_height;
    EdgePolicy m_edge;
    std::vector<std::uint8_t> m_cells;
};
