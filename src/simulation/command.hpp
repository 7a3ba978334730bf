#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace command {

struct ToggleCell {
    std::int64_t x = 0;
    std::int64_t y = 0;
};

struct Pause {};

struct Resume {};

struct TogglePause {};

// Advance exactly one generation, also while paused
struct OneStep {};

struct Clear {};

struct Randomize {
    double density = 0.25;
    std::optional<std::uint64_t> seed; // nullopt draws from random_device
};

struct Save {
    std::string path;
};

struct Load {
    std::string path;
};

using Command = std::variant<ToggleCell, Pause, Resume, TogglePause, OneStep,
                             Clear, Randomize, Save, Load>;

/**
 * @brief Input events collected during a frame, applied in order afterwards.
 */
class Queue {
  public:
    void push(const Command &cmd) { m_queue.push_back(cmd); }

    std::vector<Command> drain() {
        std::vector<Command> out;
        out.swap(m_queue);
        return out;
    }

    bool empty() const noexcept { return m_queue.empty(); }

  private:
    std::vector<Command> m_queue;
};

/** @brief Short label for status lines and logs */
std::string describe(const Command &cmd);

} // namespace command
