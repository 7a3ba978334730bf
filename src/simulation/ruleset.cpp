#include "ruleset.hpp"

#include <fmt/format.h>

#include "../utility/logger.hpp"

namespace {

constexpr std::uint16_t bit(int n) { return std::uint16_t(1u << n); }

// B3/S23
constexpr std::uint16_t CONWAY_BIRTH = bit(3);
constexpr std::uint16_t CONWAY_SURVIVE = bit(2) | bit(3);

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string describe(char c) {
    if (c >= 0x20 && c < 0x7f) {
        return fmt::format("'{}'", c);
    }
    return fmt::format("byte 0x{:02x}", static_cast<unsigned char>(c));
}

// Reads digits starting at `pos` into `mask`; stops at the first non-digit.
std::size_t read_counts(std::string_view rule, std::size_t pos,
                        std::uint16_t &mask) {
    for (; pos < rule.size() && is_digit(rule[pos]); ++pos) {
        const int count = rule[pos] - '0';
        if (count > RuleSet::MAX_NEIGHBORS) {
            throw celleste::RuleParseError(
                std::string(rule),
                fmt::format("neighbor count {} out of range 0-{}", count,
                            RuleSet::MAX_NEIGHBORS));
        }
        mask |= bit(count);
    }
    return pos;
}

void append_counts(std::string &out, std::uint16_t mask) {
    for (int n = 0; n <= RuleSet::MAX_NEIGHBORS; ++n) {
        if (mask & bit(n)) {
            out.push_back(char('0' + n));
        }
    }
}

std::vector<std::uint8_t> counts_of(std::uint16_t mask) {
    std::vector<std::uint8_t> out;
    for (int n = 0; n <= RuleSet::MAX_NEIGHBORS; ++n) {
        if (mask & bit(n)) {
            out.push_back(std::uint8_t(n));
        }
    }
    return out;
}

} // namespace

RuleSet::RuleSet() noexcept
    : m_birth_mask(CONWAY_BIRTH), m_survive_mask(CONWAY_SURVIVE) {}

RuleSet RuleSet::parse(std::string_view rule) {
    const std::string text(rule);

    for (char c : rule) {
        if (!is_digit(c) && c != 'B' && c != 'S' && c != '/') {
            throw celleste::RuleParseError(
                text, "unexpected character " + describe(c));
        }
    }

    if (rule.empty() || rule.front() != 'B') {
        throw celleste::RuleParseError(
            text, "expected 'B' marker at the start of the rule");
    }

    std::uint16_t birth = 0;
    std::size_t pos = read_counts(rule, 1, birth);

    if (pos >= rule.size() || rule[pos] != '/') {
        throw celleste::RuleParseError(
            text, fmt::format("expected '/' after birth counts at column {}",
                              pos + 1));
    }
    ++pos;

    if (pos >= rule.size() || rule[pos] != 'S') {
        throw celleste::RuleParseError(
            text, fmt::format("expected 'S' marker at column {}", pos + 1));
    }

    std::uint16_t survive = 0;
    pos = read_counts(rule, pos + 1, survive);

    if (pos != rule.size()) {
        throw celleste::RuleParseError(
            text, fmt::format("unexpected {} at column {}", describe(rule[pos]),
                              pos + 1));
    }

    LOG_DEBUG("Parsed rule '{}' (birth=0x{:03x}, survive=0x{:03x})", text,
              birth, survive);
    return RuleSet(birth, survive);
}

std::vector<std::uint8_t> RuleSet::birth_counts() const {
    return counts_of(m_birth_mask);
}

std::vector<std::uint8_t> RuleSet::survive_counts() const {
    return counts_of(m_survive_mask);
}

std::string RuleSet::to_string() const {
    std::string out = "B";
    append_counts(out, m_birth_mask);
    out += "/S";
    append_counts(out, m_survive_mask);
    return out;
}
