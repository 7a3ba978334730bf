#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "save_manager.hpp"
#include "temp_dir.hpp"
#include "utility/exceptions.hpp"

TEST_CASE("SaveManager - Basic functionality", "[save_manager]") {
    TempDir dir;
    const auto config = dir.path() / "settings" / "celleste_config.json";
    SaveManager manager(config);

    REQUIRE(manager.config_path() == config);
    REQUIRE(manager.get_recent_files().empty());
    REQUIRE(manager.get_last_opened_file().empty());

    SECTION("Save and load grid") {
        Grid grid(6, 4, EdgePolicy::Wrap);
        grid.set(1, 1, true);
        grid.set(5, 3, true);
        const auto rule = RuleSet::parse("B36/S23");
        const std::string path = dir.file("grid.cel");

        REQUIRE_NOTHROW(manager.save_grid(path, grid, rule));
        REQUIRE(std::filesystem::exists(path));

        const codec::Snapshot snap = manager.load_grid(path);
        REQUIRE(snap.grid == grid);
        REQUIRE(snap.rule == rule);

        REQUIRE(manager.get_last_opened_file() == path);
        REQUIRE(manager.get_recent_files() == std::vector<std::string>{path});
    }

    SECTION("Load errors leave recent files alone") {
        REQUIRE_THROWS_AS(manager.load_grid(dir.file("missing.cel")),
                          celleste::IOError);

        const std::string junk = dir.file("junk.cel");
        std::ofstream(junk) << "CLST but not really";
        REQUIRE_THROWS_AS(manager.load_grid(junk),
                          celleste::MalformedSaveError);

        REQUIRE(manager.get_recent_files().empty());
        REQUIRE(manager.get_last_opened_file().empty());
    }

    SECTION("Save error") {
        REQUIRE_THROWS_AS(manager.save_grid(dir.file("no/such/dir.cel"),
                                            Grid(2, 2), RuleSet{}),
                          celleste::IOError);
        REQUIRE(manager.get_recent_files().empty());
    }
}

TEST_CASE("SaveManager - Recent files", "[save_manager]") {
    TempDir dir;
    SaveManager manager(dir.path() / "celleste_config.json");

    SECTION("Most recent first, no duplicates") {
        manager.add_to_recent("a.cel");
        manager.add_to_recent("b.cel");
        manager.add_to_recent("a.cel");

        const auto recent = manager.get_recent_files();
        REQUIRE(recent == std::vector<std::string>{"a.cel", "b.cel"});
    }

    SECTION("Capped at ten entries") {
        for (int i = 0; i < 15; ++i) {
            manager.add_to_recent("file" + std::to_string(i) + ".cel");
        }

        const auto recent = manager.get_recent_files();
        REQUIRE(recent.size() == 10);
        REQUIRE(recent.front() == "file14.cel");
        REQUIRE(recent.back() == "file5.cel");
    }

    SECTION("Clear") {
        manager.add_to_recent("a.cel");
        manager.clear_recent_files();
        REQUIRE(manager.get_recent_files().empty());
    }
}

TEST_CASE("SaveManager - Settings persist across instances",
          "[save_manager]") {
    TempDir dir;
    const auto config = dir.path() / "celleste_config.json";

    {
        SaveManager manager(config);
        manager.add_to_recent("one.cel");
        manager.add_to_recent("two.cel");
        manager.set_last_opened_file("two.cel");

        SaveManager::WindowState state;
        state.width = 1024;
        state.height = 768;
        state.x = 40;
        state.y = 60;
        manager.save_window_state(state);
    }

    SaveManager manager(config);
    REQUIRE(manager.get_recent_files() ==
            std::vector<std::string>{"two.cel", "one.cel"});
    REQUIRE(manager.get_last_opened_file() == "two.cel");

    const auto state = manager.load_window_state();
    REQUIRE(state.width == 1024);
    REQUIRE(state.height == 768);
    REQUIRE(state.x == 40);
    REQUIRE(state.y == 60);

    // window state and recent files share one file without clobbering
    manager.add_to_recent("three.cel");
    REQUIRE(manager.load_window_state().width == 1024);
}

TEST_CASE("SaveManager - Save and load record the file in the settings",
          "[save_manager]") {
    TempDir dir;
    const auto config = dir.path() / "celleste_config.json";
    const std::string first = dir.file("first.cel");
    const std::string second = dir.file("second.cel");

    {
        SaveManager manager(config);
        manager.save_grid(first, Grid(3, 3), RuleSet{});
        manager.save_grid(second, Grid(3, 3), RuleSet{});
        manager.load_grid(first);
    }

    std::ifstream in(config);
    const nlohmann::json j = nlohmann::json::parse(in);
    REQUIRE(j.at("last_file") == first);
    REQUIRE(j.at("recent_files") ==
            nlohmann::json::array({first, second}));

    SaveManager reopened(config);
    REQUIRE(reopened.get_last_opened_file() == first);
    REQUIRE(reopened.get_recent_files() ==
            std::vector<std::string>{first, second});
}

TEST_CASE("SaveManager - Bad settings file falls back to defaults",
          "[save_manager]") {
    TempDir dir;
    const auto config = dir.path() / "celleste_config.json";

    SECTION("Not JSON") {
        std::ofstream(config) << "{ this is not json";
    }
    SECTION("Wrong types") {
        std::ofstream(config)
            << R"({"recent_files": 5, "last_file": [], "window_state": 3})";
    }
    SECTION("Not an object") {
        std::ofstream(config) << "[1, 2, 3]";
    }

    SaveManager manager(config);
    REQUIRE(manager.get_recent_files().empty());
    REQUIRE(manager.get_last_opened_file().empty());

    const auto state = manager.load_window_state();
    REQUIRE(state.width == SaveManager::WindowState{}.width);
    REQUIRE(state.height == SaveManager::WindowState{}.height);

    // the next write replaces the broken file with valid JSON
    manager.add_to_recent("x.cel");
    std::ifstream in(config);
    const auto j = nlohmann::json::parse(in);
    REQUIRE(j["recent_files"] == nlohmann::json::array({"x.cel"}));
}

TEST_CASE("SaveManager - Default config path", "[save_manager]") {
    const auto path = SaveManager::default_config_path();
    REQUIRE(path.filename() == "celleste_config.json");
    REQUIRE(path.parent_path().filename() == ".celleste");
}
