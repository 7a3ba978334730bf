#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

#include "simulation/command.hpp"

TEST_CASE("Command queue drains in order", "[command]") {
    command::Queue queue;
    REQUIRE(queue.empty());

    queue.push(command::Pause{});
    queue.push(command::ToggleCell{3, 4});
    queue.push(command::Save{"a.cel"});
    REQUIRE_FALSE(queue.empty());

    const auto drained = queue.drain();
    REQUIRE(queue.empty());
    REQUIRE(drained.size() == 3);
    REQUIRE(std::holds_alternative<command::Pause>(drained[0]));

    const auto &toggle = std::get<command::ToggleCell>(drained[1]);
    REQUIRE(toggle.x == 3);
    REQUIRE(toggle.y == 4);
    REQUIRE(std::get<command::Save>(drained[2]).path == "a.cel");

    REQUIRE(queue.drain().empty());
}

TEST_CASE("Command descriptions", "[command]") {
    REQUIRE(command::describe(command::Pause{}) == "pause");
    REQUIRE(command::describe(command::Resume{}) == "resume");
    REQUIRE(command::describe(command::OneStep{}) == "step");
    REQUIRE(command::describe(command::Clear{}) == "clear");
    REQUIRE(command::describe(command::ToggleCell{-1, 7}) ==
            "toggle (-1, 7)");
    REQUIRE(command::describe(command::Randomize{0.25, {}}) ==
            "randomize (25%)");
    REQUIRE(command::describe(command::Save{"x.cel"}) == "save x.cel");
    REQUIRE(command::describe(command::Load{"y.cel"}) == "load y.cel");
}
