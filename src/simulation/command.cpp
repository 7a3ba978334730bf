#include "command.hpp"

#include <type_traits>

#include <fmt/format.h>

namespace command {

std::string describe(const Command &cmd) {
    return std::visit(
        [](auto &&c) -> std::string {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, ToggleCell>) {
                return fmt::format("toggle ({}, {})", c.x, c.y);
            } else if constexpr (std::is_same_v<T, Pause>) {
                return "pause";
            } else if constexpr (std::is_same_v<T, Resume>) {
                return "resume";
            } else if constexpr (std::is_same_v<T, TogglePause>) {
                return "pause/resume";
            } else if constexpr (std::is_same_v<T, OneStep>) {
                return "step";
            } else if constexpr (std::is_same_v<T, Clear>) {
                return "clear";
            } else if constexpr (std::is_same_v<T, Randomize>) {
                return fmt::format("randomize ({:.0f}%)", c.density * 100.0);
            } else if constexpr (std::is_same_v<T, Save>) {
                return fmt::format("save {}", c.path);
            } else if constexpr (std::is_same_v<T, Load>) {
                return fmt::format("load {}", c.path);
            }
        },
        cmd);
}

} // namespace command
