#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../utility/exceptions.hpp"

/**
 * @brief Birth/survival rule of a 2-state, 8-neighbor cellular automaton.
 *
 * Each set of neighbor counts is a 9-bit mask (bit n set means count n is a
 * member). Instances are immutable; the only way to build a non-default one
 * is RuleSet::parse.
 */
class RuleSet {
  public:
    /** @brief Largest neighbor count in the 8-neighborhood */
    static constexpr int MAX_NEIGHBORS = 8;

    /** @brief Rule used when none is given on the command line */
    static constexpr const char *DEFAULT_RULE = "B3/S23";

    /**
     * @brief Conway's Game of Life, same as parse("B3/S23").
     */
    RuleSet() noexcept;

    /**
     * @brief Parses a rule in B/S notation, e.g. "B36/S23".
     * @param rule Rule text; markers are uppercase, digits 0-8 in any order
     * @return Parsed rule
     * @throws celleste::RuleParseError if the text is not a valid rule
     */
    static RuleSet parse(std::string_view rule);

    inline bool is_birth(int neighbors) const noexcept {
        return neighbors >= 0 && neighbors <= MAX_NEIGHBORS &&
               (m_birth_mask >> neighbors) & 1u;
    }

    inline bool is_survive(int neighbors) const noexcept {
        return neighbors >= 0 && neighbors <= MAX_NEIGHBORS &&
               (m_survive_mask >> neighbors) & 1u;
    }

    /**
     * @brief Next state of one cell.
     * @param alive Current state of the cell
     * @param neighbors Live neighbors in the current generation
     */
    inline bool next_state(bool alive, int neighbors) const noexcept {
        return alive ? is_survive(neighbors) : is_birth(neighbors);
    }

    inline std::uint16_t birth_mask() const noexcept { return m_birth_mask; }
    inline std::uint16_t survive_mask() const noexcept {
        return m_survive_mask;
    }

    /** @brief Birth counts in ascending order */
    std::vector<std::uint8_t> birth_counts() const;

    /** @brief Survival counts in ascending order */
    std::vector<std::uint8_t> survive_counts() const;

    /**
     * @brief Canonical text form: ascending, de-duplicated digits.
     */
    std::string to_string() const;

    friend bool operator==(const RuleSet &, const RuleSet &) = default;

  private:
    RuleSet(std::uint16_t birth_mask, std::uint16_t survive_mask) noexcept
        : m_birth_mask(birth_mask), m_survive_mask(survive_mask) {}

    std::uint16_t m_birth_mask;
    std::uint16_t m_survive_mask;
};
