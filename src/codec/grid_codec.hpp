#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "../simulation/grid.hpp"
#include "../simulation/ruleset.hpp"
#include "../utility/exceptions.hpp"

/**
 * Binary save format, version 1. Integers are little-endian.
 *
 *   offset  size          field
 *   0       4             magic "CLST"
 *   4       1             format version (1)
 *   5       1             edge policy (0 clamp, 1 wrap)
 *   6       4             width
 *   10      4             height
 *   14      1             rule length L, 0 when no rule is stored
 *   15      L             canonical rule text, e.g. "B3/S23"
 *   15+L    ceil(w*h/8)   cells, row-major, cell i is bit (i % 8) of
 *                         byte (i / 8); unused bits of the last byte are 0
 *
 * The file must be exactly as long as the header says.
 */
namespace codec {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::uint8_t MAGIC[4] = {'C', 'L', 'S', 'T'};
inline constexpr std::uint8_t FORMAT_VERSION = 1;
inline constexpr std::size_t HEADER_SIZE = 15;

/**
 * @brief Decoded save: the grid and, when present, the rule it ran under.
 */
struct Snapshot {
    Grid grid;
    std::optional<RuleSet> rule;
};

/**
 * @brief Serializes a grid without a rule.
 */
Bytes encode(const Grid &grid);

/**
 * @brief Serializes a grid together with its rule.
 */
Bytes encode(const Grid &grid, const RuleSet &rule);

/**
 * @brief Parses a complete save.
 * @throws celleste::MalformedSaveError on any header or length mismatch
 */
Snapshot decode(const Bytes &bytes);

/**
 * @brief decode(bytes).grid
 * @throws celleste::MalformedSaveError
 */
Grid decode_grid(const Bytes &bytes);

/**
 * @brief Reads a whole file.
 * @throws celleste::IOError if the file cannot be opened or read
 */
Bytes read_file(const std::filesystem::path &path);

/**
 * @brief Writes a whole file through a temporary sibling and a rename, so a
 * failed write never leaves a half-written save behind.
 * @throws celleste::IOError
 */
void write_file(const std::filesystem::path &path, const Bytes &bytes);

} // namespace codec
