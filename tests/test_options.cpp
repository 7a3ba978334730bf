#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

#include "cli/options.hpp"
#include "utility/exceptions.hpp"

namespace {

// getopt_long permutes argv, so the strings have to be writable
class Args {
  public:
    explicit Args(std::vector<std::string> args) : m_storage(std::move(args)) {
        m_storage.insert(m_storage.begin(), "celleste");
        for (auto &s : m_storage) {
            m_argv.push_back(s.data());
        }
        m_argv.push_back(nullptr);
    }

    int argc() const { return int(m_storage.size()); }
    char **argv() { return m_argv.data(); }

  private:
    std::vector<std::string> m_storage;
    std::vector<char *> m_argv;
};

cli::AppOptions parse(const std::vector<std::string> &args) {
    Args a(args);
    return cli::parse_options(a.argc(), a.argv());
}

} // namespace

TEST_CASE("Options defaults", "[options]") {
    const auto opt = parse({});

    REQUIRE(opt.rules == "B3/S23");
    REQUIRE(opt.save_file == "./celleste_save.cel");
    REQUIRE_FALSE(opt.load_file.has_value());
    REQUIRE_FALSE(opt.show_help);
    REQUIRE(opt.engine.width == 160);
    REQUIRE(opt.engine.height == 120);
    REQUIRE(opt.engine.edge == EdgePolicy::Clamp);
    REQUIRE(opt.engine.start_running);
    REQUIRE(opt.engine.step_threads == 1);
    REQUIRE(opt.engine.target_tps == 0);
    REQUIRE(opt.engine.random_density == 0.0);
    REQUIRE_FALSE(opt.engine.random_seed.has_value());
}

TEST_CASE("Options rule argument", "[options]") {
    SECTION("Positional") {
        REQUIRE(parse({"B36/S23"}).rules == "B36/S23");
    }

    SECTION("Long option") {
        REQUIRE(parse({"--rules", "B2/S"}).rules == "B2/S");
        REQUIRE(parse({"--rules=B2/S"}).rules == "B2/S");
    }

    SECTION("Short option") {
        REQUIRE(parse({"-r", "B1/S1"}).rules == "B1/S1");
    }

    SECTION("Positional after options") {
        const auto opt = parse({"--wrap", "B36/S23", "-p"});
        REQUIRE(opt.rules == "B36/S23");
        REQUIRE(opt.engine.edge == EdgePolicy::Wrap);
        REQUIRE_FALSE(opt.engine.start_running);
    }

    SECTION("Rule text is not validated here") {
        REQUIRE(parse({"nonsense"}).rules == "nonsense");
    }
}

TEST_CASE("Options full command line", "[options]") {
    const auto opt =
        parse({"-s", "out.cel", "--load-file", "in.cel", "-W", "64", "-H",
               "48", "-w", "--paused", "-t", "0", "--tps", "30", "-d", "0.4",
               "--seed", "12345"});

    REQUIRE(opt.save_file == "out.cel");
    REQUIRE(opt.load_file == "in.cel");
    REQUIRE(opt.engine.width == 64);
    REQUIRE(opt.engine.height == 48);
    REQUIRE(opt.engine.edge == EdgePolicy::Wrap);
    REQUIRE_FALSE(opt.engine.start_running);
    REQUIRE(opt.engine.step_threads == 0);
    REQUIRE(opt.engine.target_tps == 30);
    REQUIRE(opt.engine.random_density == 0.4);
    REQUIRE(opt.engine.random_seed == 12345u);
}

TEST_CASE("Options help flag", "[options]") {
    REQUIRE(parse({"-h"}).show_help);
    REQUIRE(parse({"--help"}).show_help);

    const std::string text = cli::usage("celleste");
    REQUIRE(text.find("--rules") != std::string::npos);
    REQUIRE(text.find("--save-file") != std::string::npos);
    REQUIRE(text.find("--load-file") != std::string::npos);
}

TEST_CASE("Options reject bad input", "[options]") {
    const std::vector<std::vector<std::string>> cases = {
        {"--bogus"},
        {"-x"},
        {"--width"},
        {"-W", "0"},
        {"-W", "abc"},
        {"-H", "12x"},
        {"-H", "99999999"},
        {"-t", "-2"},
        {"--tps", "-1"},
        {"-d", "1.5"},
        {"-d", "-0.1"},
        {"-d", "lots"},
        {"--seed", "-4"},
        {"B3/S23", "extra"},
        {"-r", "B3/S23", "B36/S23"}};

    for (const auto &args : cases) {
        INFO("args: " << args.front());
        REQUIRE_THROWS_AS(parse(args), celleste::ConfigError);
    }
}

TEST_CASE("Options can be parsed repeatedly", "[options]") {
    REQUIRE(parse({"-W", "10"}).engine.width == 10);
    REQUIRE(parse({"-W", "20"}).engine.width == 20);
    REQUIRE(parse({}).engine.width == 160);
}
