#include <catch2/catch_test_macros.hpp>

#include <random>

#include "simulation/grid.hpp"
#include "utility/exceptions.hpp"

TEST_CASE("Grid starts dead", "[grid]") {
    Grid grid(7, 5);

    REQUIRE(grid.width() == 7);
    REQUIRE(grid.height() == 5);
    REQUIRE(grid.size() == 35);
    REQUIRE(grid.edge_policy() == EdgePolicy::Clamp);
    REQUIRE(grid.live_count() == 0);
}

TEST_CASE("Grid rejects zero dimensions", "[grid]") {
    REQUIRE_THROWS_AS(Grid(0, 4), celleste::ConfigError);
    REQUIRE_THROWS_AS(Grid(4, 0), celleste::ConfigError);
}

TEST_CASE("Grid initializer seeds cells", "[grid]") {
    Grid grid(4, 4, EdgePolicy::Wrap, [](std::uint32_t x, std::uint32_t y) {
        return x == y;
    });

    REQUIRE(grid.live_count() == 4);
    REQUIRE(grid.get(2, 2));
    REQUIRE_FALSE(grid.get(1, 2));
}

TEST_CASE("Grid set, get and toggle", "[grid]") {
    Grid grid(3, 3);

    grid.set(1, 2, true);
    REQUIRE(grid.get(1, 2));

    grid.toggle_cell(1, 2);
    REQUIRE_FALSE(grid.get(1, 2));

    grid.toggle_cell(0, 0);
    grid.toggle_cell(0, 0);
    grid.toggle_cell(0, 0);
    REQUIRE(grid.get(0, 0));
    REQUIRE(grid.live_count() == 1);
}

TEST_CASE("Grid checked access rejects out-of-bounds cells", "[grid]") {
    Grid grid(3, 3);

    REQUIRE_THROWS_AS(grid.get(-1, 0), celleste::OutOfBoundsError);
    REQUIRE_THROWS_AS(grid.get(3, 0), celleste::OutOfBoundsError);
    REQUIRE_THROWS_AS(grid.set(0, 3, true), celleste::OutOfBoundsError);
    REQUIRE_THROWS_AS(grid.toggle_cell(0, -5), celleste::OutOfBoundsError);
    REQUIRE_THROWS_AS(grid.count_live_neighbors(10, 10),
                      celleste::OutOfBoundsError);

    // nothing changed
    REQUIRE(grid.live_count() == 0);
}

TEST_CASE("Grid neighbor counts", "[grid]") {
    Grid grid(5, 5);

    SECTION("Center with full ring") {
        for (int y = 1; y <= 3; ++y) {
            for (int x = 1; x <= 3; ++x) {
                grid.set(x, y, true);
            }
        }
        // the cell itself is not counted
        REQUIRE(grid.count_live_neighbors(2, 2) == 8);
        REQUIRE(grid.count_live_neighbors(0, 0) == 1);
        REQUIRE(grid.count_live_neighbors(0, 2) == 3);
    }

    SECTION("Isolated cell") {
        grid.set(2, 2, true);
        REQUIRE(grid.count_live_neighbors(2, 2) == 0);
        REQUIRE(grid.count_live_neighbors(1, 1) == 1);
        REQUIRE(grid.count_live_neighbors(4, 4) == 0);
    }
}

TEST_CASE("Grid edge policy decides corner neighbors", "[grid]") {
    SECTION("Clamp treats outside cells as dead") {
        Grid grid(4, 4, EdgePolicy::Clamp);
        grid.set(3, 3, true);
        REQUIRE(grid.count_live_neighbors(0, 0) == 0);
    }

    SECTION("Wrap links opposite corners") {
        Grid grid(4, 4, EdgePolicy::Wrap);
        grid.set(3, 3, true);
        REQUIRE(grid.count_live_neighbors(0, 0) == 1);
        REQUIRE(grid.count_live_neighbors(3, 0) == 1);
        REQUIRE(grid.count_live_neighbors(0, 3) == 1);
    }

    SECTION("Wrap along one edge") {
        Grid grid(6, 3, EdgePolicy::Wrap);
        grid.set(5, 1, true);
        REQUIRE(grid.count_live_neighbors(0, 0) == 1);
        REQUIRE(grid.count_live_neighbors(0, 1) == 1);
        REQUIRE(grid.count_live_neighbors(0, 2) == 1);
        REQUIRE(grid.count_live_neighbors(2, 1) == 0);
    }

    SECTION("Wrap on a single cell counts the cell eight times") {
        Grid grid(1, 1, EdgePolicy::Wrap);
        grid.set(0, 0, true);
        REQUIRE(grid.count_live_neighbors(0, 0) == 8);
        REQUIRE(grid.live_neighbors_at(0, 0) == 8);
    }

    SECTION("Wrap on a one-wide column folds sideways onto itself") {
        Grid grid(1, 3, EdgePolicy::Wrap);
        grid.set(0, 0, true);
        // left and right land on the cell itself, rows above and below
        // count three times each
        REQUIRE(grid.count_live_neighbors(0, 0) == 2);
        REQUIRE(grid.count_live_neighbors(0, 1) == 3);
        REQUIRE(grid.count_live_neighbors(0, 2) == 3);
    }

    SECTION("Clamp on a one-wide column sees only real cells") {
        Grid grid(1, 3, EdgePolicy::Clamp);
        grid.set(0, 0, true);
        REQUIRE(grid.count_live_neighbors(0, 0) == 0);
        REQUIRE(grid.count_live_neighbors(0, 1) == 1);
        REQUIRE(grid.count_live_neighbors(0, 2) == 0);
    }
}

TEST_CASE("Grid checked and unchecked counts agree", "[grid]") {
    std::mt19937_64 rng(7);
    for (EdgePolicy edge : {EdgePolicy::Clamp, EdgePolicy::Wrap}) {
        Grid grid(9, 6, edge);
        grid.randomize(rng, 0.4);
        for (std::uint32_t y = 0; y < grid.height(); ++y) {
            for (std::uint32_t x = 0; x < grid.width(); ++x) {
                REQUIRE(grid.live_neighbors_at(x, y) ==
                        grid.count_live_neighbors(x, y));
            }
        }
    }
}

TEST_CASE("Grid clear and randomize", "[grid]") {
    Grid grid(32, 32);
    std::mt19937_64 rng(42);

    grid.randomize(rng, 1.0);
    REQUIRE(grid.live_count() == grid.size());

    grid.randomize(rng, 0.0);
    REQUIRE(grid.live_count() == 0);

    grid.randomize(rng, 0.5);
    REQUIRE(grid.live_count() > 0);
    REQUIRE(grid.live_count() < grid.size());

    grid.clear();
    REQUIRE(grid.live_count() == 0);

    REQUIRE_THROWS_AS(grid.randomize(rng, 1.5), celleste::ConfigError);
    REQUIRE_THROWS_AS(grid.randomize(rng, -0.1), celleste::ConfigError);
}

TEST_CASE("Grid randomize is reproducible from a seed", "[grid]") {
    Grid a(20, 20);
    Grid b(20, 20);
    std::mt19937_64 rng_a(1234);
    std::mt19937_64 rng_b(1234);

    a.randomize(rng_a, 0.3);
    b.randomize(rng_b, 0.3);
    REQUIRE(a == b);
}
