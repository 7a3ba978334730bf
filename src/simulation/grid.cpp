#include "grid.hpp"

#include <algorithm>

#include "../utility/logger.hpp"

namespace {

constexpr int neighbor_offsets[8][2] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                                        {1, 0},   {-1, 1}, {0, 1},  {1, 1}};

std::uint32_t checked_dimension(std::uint32_t value, const char *name) {
    if (value == 0) {
        throw celleste::ConfigError(
            fmt::format("Grid {} must be at least 1", name));
    }
    return value;
}

} // namespace

const char *to_string(EdgePolicy edge) noexcept {
    switch (edge) {
    case EdgePolicy::Clamp:
        return "clamp";
    case EdgePolicy::Wrap:
        return "wrap";
    default:
        return "unknown";
    }
}

Grid::Grid(std::uint32_t width, std::uint32_t height, EdgePolicy edge)
    : m_width(checked_dimension(width, "width")),
      m_height(checked_dimension(height, "height")), m_edge(edge),
      m_cells(std::size_t(width) * height, 0) {}

Grid::Grid(std::uint32_t width, std::uint32_t height, EdgePolicy edge,
           const CellInit &initial)
    : Grid(width, height, edge) {
    if (!initial) {
        return;
    }
    for (std::uint32_t y = 0; y < m_height; ++y) {
        for (std::uint32_t x = 0; x < m_width; ++x) {
            put(x, y, initial(x, y));
        }
    }
}

void Grid::check_bounds(std::int64_t x, std::int64_t y) const {
    if (!in_bounds(x, y)) {
        throw celleste::OutOfBoundsError(x, y, m_width, m_height);
    }
}

bool Grid::get(std::int64_t x, std::int64_t y) const {
    check_bounds(x, y);
    return at(std::uint32_t(x), std::uint32_t(y));
}

void Grid::set(std::int64_t x, std::int64_t y, bool alive) {
    check_bounds(x, y);
    put(std::uint32_t(x), std::uint32_t(y), alive);
}

void Grid::toggle_cell(std::int64_t x, std::int64_t y) {
    check_bounds(x, y);
    auto &cell = m_cells[index_of(std::uint32_t(x), std::uint32_t(y))];
    cell = cell ? 0 : 1;
}

std::uint8_t Grid::count_live_neighbors(std::int64_t x, std::int64_t y) const {
    check_bounds(x, y);
    return live_neighbors_at(std::uint32_t(x), std::uint32_t(y));
}

std::uint8_t Grid::live_neighbors_at(std::uint32_t x,
                                     std::uint32_t y) const noexcept {
    const std::int64_t w = m_width;
    const std::int64_t h = m_height;
    std::uint8_t count = 0;

    for (const auto &offset : neighbor_offsets) {
        std::int64_t nx = std::int64_t(x) + offset[0];
        std::int64_t ny = std::int64_t(y) + offset[1];

        if (m_edge == EdgePolicy::Wrap) {
            // offsets are -1..1, so one correction step suffices
            nx = (nx + w) % w;
            ny = (ny + h) % h;
        } else if (nx < 0 || ny < 0 || nx >= w || ny >= h) {
            continue;
        }

        count += m_cells[std::size_t(ny) * m_width + std::size_t(nx)];
    }

    return count;
}

void Grid::clear() noexcept { std::fill(m_cells.begin(), m_cells.end(), 0); }

void Grid::randomize(std::mt19937_64 &rng, double density) {
    if (!(density >= 0.0 && density <= 1.0)) {
        throw celleste::ConfigError(
            fmt::format("Fill density {} outside [0, 1]", density));
    }

    std::bernoulli_distribution alive(density);
    for (auto &cell : m_cells) {
        cell = alive(rng) ? 1 : 0;
    }

    LOG_DEBUG("Randomized {}x{} grid at density {:.2f}: {} live", m_width,
              m_height, density, live_count());
}

std::size_t Grid::live_count() const noexcept {
    return std::size_t(std::count(m_cells.begin(), m_cells.end(), 1));
}
