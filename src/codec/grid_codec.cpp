#include "grid_codec.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include "../simulation/engine_config.hpp"
#include "../utility/logger.hpp"

namespace codec {

namespace {

constexpr std::size_t OFFSET_VERSION = 4;
constexpr std::size_t OFFSET_EDGE = 5;
constexpr std::size_t OFFSET_WIDTH = 6;
constexpr std::size_t OFFSET_HEIGHT = 10;
constexpr std::size_t OFFSET_RULE_LENGTH = 14;

std::uint64_t packed_size(std::uint32_t width, std::uint32_t height) {
    return (std::uint64_t(width) * height + 7) / 8;
}

void put_u32(Bytes &out, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(std::uint8_t(value >> shift));
    }
}

std::uint32_t get_u32(const Bytes &in, std::size_t offset) {
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= std::uint32_t(in[offset + i]) << (8 * i);
    }
    return value;
}

Bytes encode_impl(const Grid &grid, const std::string &rule) {
    if (rule.size() > 0xff) {
        throw celleste::CodecError(
            fmt::format("Rule text '{}' too long to store", rule));
    }

    const auto &cells = grid.cells();

    Bytes out;
    out.reserve(HEADER_SIZE + rule.size() +
                packed_size(grid.width(), grid.height()));

    out.insert(out.end(), std::begin(MAGIC), std::end(MAGIC));
    out.push_back(FORMAT_VERSION);
    out.push_back(static_cast<std::uint8_t>(grid.edge_policy()));
    put_u32(out, grid.width());
    put_u32(out, grid.height());
    out.push_back(std::uint8_t(rule.size()));
    out.insert(out.end(), rule.begin(), rule.end());

    std::uint8_t byte = 0;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i]) {
            byte |= std::uint8_t(1u << (i % 8));
        }
        if (i % 8 == 7) {
            out.push_back(byte);
            byte = 0;
        }
    }
    if (cells.size() % 8 != 0) {
        out.push_back(byte);
    }

    return out;
}

[[noreturn]] void malformed(const std::string &reason) {
    LOG_WARN("Rejecting save: {}", reason);
    throw celleste::MalformedSaveError(reason);
}

} // namespace

Bytes encode(const Grid &grid) { return encode_impl(grid, std::string()); }

Bytes encode(const Grid &grid, const RuleSet &rule) {
    return encode_impl(grid, rule.to_string());
}

Snapshot decode(const Bytes &bytes) {
    if (bytes.size() < HEADER_SIZE) {
        malformed(fmt::format("header truncated ({} of {} bytes)", bytes.size(),
                              HEADER_SIZE));
    }

    if (!std::equal(std::begin(MAGIC), std::end(MAGIC), bytes.begin())) {
        malformed("not a celleste save (bad magic)");
    }

    const std::uint8_t version = bytes[OFFSET_VERSION];
    if (version != FORMAT_VERSION) {
        malformed(fmt::format("unsupported format version {}", version));
    }

    const std::uint8_t edge_byte = bytes[OFFSET_EDGE];
    if (edge_byte > static_cast<std::uint8_t>(EdgePolicy::Wrap)) {
        malformed(fmt::format("unknown edge policy {}", edge_byte));
    }
    const auto edge = static_cast<EdgePolicy>(edge_byte);

    const std::uint32_t width = get_u32(bytes, OFFSET_WIDTH);
    const std::uint32_t height = get_u32(bytes, OFFSET_HEIGHT);
    if (width == 0 || height == 0 || width > EngineConfig::MAX_DIMENSION ||
        height > EngineConfig::MAX_DIMENSION) {
        malformed(fmt::format("invalid dimensions {}x{}", width, height));
    }

    const std::size_t rule_length = bytes[OFFSET_RULE_LENGTH];
    if (bytes.size() < HEADER_SIZE + rule_length) {
        malformed("rule text truncated");
    }

    std::optional<RuleSet> rule;
    if (rule_length > 0) {
        const std::string text(bytes.begin() + HEADER_SIZE,
                               bytes.begin() + HEADER_SIZE + rule_length);
        try {
            rule = RuleSet::parse(text);
        } catch (const celleste::RuleParseError &e) {
            malformed(fmt::format("stored rule is invalid: {}", e.what()));
        }
    }

    const std::size_t cells_offset = HEADER_SIZE + rule_length;
    const std::uint64_t payload = bytes.size() - cells_offset;
    const std::uint64_t expected = packed_size(width, height);
    if (payload != expected) {
        malformed(fmt::format("cell data is {} bytes, {}x{} needs {}", payload,
                              width, height, expected));
    }

    const std::uint64_t cell_count = std::uint64_t(width) * height;
    if (cell_count % 8 != 0) {
        const std::uint8_t unused =
            std::uint8_t(0xffu << (cell_count % 8)) & 0xffu;
        if (bytes.back() & unused) {
            malformed("padding bits after the last cell are set");
        }
    }

    const std::uint8_t *packed = bytes.data() + cells_offset;
    Grid grid(width, height, edge,
              [packed, width](std::uint32_t x, std::uint32_t y) {
                  const std::uint64_t i = std::uint64_t(y) * width + x;
                  return ((packed[i / 8] >> (i % 8)) & 1u) != 0;
              });

    return Snapshot{std::move(grid), rule};
}

Grid decode_grid(const Bytes &bytes) { return decode(bytes).grid; }

Bytes read_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw celleste::IOError(
            fmt::format("{} is a directory", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw celleste::IOError(fmt::format("Failed to open {} for reading: {}",
                                            path.string(),
                                            std::strerror(errno)));
    }

    Bytes bytes((std::istreambuf_iterator<char>(file)),
                std::istreambuf_iterator<char>());

    if (file.bad()) {
        throw celleste::IOError(
            fmt::format("Failed to read {}", path.string()));
    }

    LOG_DEBUG("Read {} bytes from {}", bytes.size(), path.string());
    return bytes;
}

void write_file(const std::filesystem::path &path, const Bytes &bytes) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw celleste::IOError(
                fmt::format("Failed to open {} for writing: {}", tmp.string(),
                            std::strerror(errno)));
        }

        file.write(reinterpret_cast<const char *>(bytes.data()),
                   std::streamsize(bytes.size()));
        file.flush();
        if (!file) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw celleste::IOError(
                fmt::format("Failed to write {}", tmp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw celleste::IOError(fmt::format("Failed to replace {}: {}",
                                            path.string(), ec.message()));
    }

    LOG_DEBUG("Wrote {} bytes to {}", bytes.size(), path.string());
}

} // namespace codec
