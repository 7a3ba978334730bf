#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace celleste {

/**
 * Base exception class for all celleste errors
 */
class CellesteException : public std::runtime_error {
  public:
    explicit CellesteException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Malformed B/S rule string
 */
class RuleParseError : public CellesteException {
  public:
    RuleParseError(const std::string &rule, const std::string &reason)
        : CellesteException(
              fmt::format("Rule parse error: '{}': {}", rule, reason)),
          m_rule(rule) {}

    const std::string &rule() const noexcept { return m_rule; }

  private:
    std::string m_rule;
};

/**
 * Cell coordinate outside the grid
 */
class OutOfBoundsError : public CellesteException {
  public:
    OutOfBoundsError(std::int64_t x, std::int64_t y, std::uint32_t width,
                     std::uint32_t height)
        : CellesteException(fmt::format(
              "Out of bounds: cell ({}, {}) outside {}x{} grid", x, y, width,
              height)) {}
};

/**
 * Exception for simulation-related errors
 */
class SimulationError : public CellesteException {
  public:
    explicit SimulationError(const std::string &message)
        : CellesteException("Simulation error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public CellesteException {
  public:
    explicit ConfigError(const std::string &message)
        : CellesteException("Configuration error: " + message) {}
};

/**
 * Base of the two save/load failures. Catch this to handle both.
 */
class CodecError : public CellesteException {
  public:
    using CellesteException::CellesteException;
};

/**
 * Save data whose content cannot be decoded (corrupt or foreign file)
 */
class MalformedSaveError : public CodecError {
  public:
    explicit MalformedSaveError(const std::string &message)
        : CodecError("Malformed save: " + message) {}
};

/**
 * Exception for I/O operations (missing file, permissions, short writes)
 */
class IOError : public CodecError {
  public:
    explicit IOError(const std::string &message)
        : CodecError("I/O error: " + message) {}
};

} // namespace celleste
