#include <catch2/catch_test_macros.hpp>

#include <string>

#include "simulation/ruleset.hpp"
#include "utility/exceptions.hpp"

TEST_CASE("RuleSet default is Conway", "[ruleset]") {
    RuleSet rules;

    REQUIRE(rules == RuleSet::parse("B3/S23"));
    REQUIRE(rules.to_string() == "B3/S23");
    REQUIRE(rules.is_birth(3));
    REQUIRE_FALSE(rules.is_birth(2));
    REQUIRE(rules.is_survive(2));
    REQUIRE(rules.is_survive(3));
    REQUIRE_FALSE(rules.is_survive(4));
}

TEST_CASE("RuleSet parses B/S notation", "[ruleset]") {
    SECTION("HighLife") {
        auto rules = RuleSet::parse("B36/S23");
        REQUIRE(rules.birth_counts() == std::vector<std::uint8_t>{3, 6});
        REQUIRE(rules.survive_counts() == std::vector<std::uint8_t>{2, 3});
    }

    SECTION("Empty sets") {
        auto rules = RuleSet::parse("B/S");
        REQUIRE(rules.birth_mask() == 0);
        REQUIRE(rules.survive_mask() == 0);
        REQUIRE(rules.to_string() == "B/S");
    }

    SECTION("Full range 0-8") {
        auto rules = RuleSet::parse("B012345678/S012345678");
        REQUIRE(rules.birth_mask() == 0x1ff);
        REQUIRE(rules.survive_mask() == 0x1ff);
    }

    SECTION("Unordered and repeated digits canonicalize") {
        auto rules = RuleSet::parse("B633/S32");
        REQUIRE(rules.to_string() == "B36/S23");
        REQUIRE(rules == RuleSet::parse("B36/S23"));
    }
}

TEST_CASE("RuleSet canonical text parses back to the same rule",
          "[ruleset]") {
    for (const char *text : {"B3/S23", "B36/S23", "B2/S", "B/S012345678",
                             "B1357/S1357", "B3678/S34678"}) {
        auto rules = RuleSet::parse(text);
        REQUIRE(RuleSet::parse(rules.to_string()) == rules);
    }
}

TEST_CASE("RuleSet rejects malformed rules", "[ruleset]") {
    for (const char *text :
         {"", "3/S23", "B3S23", "B9/S23", "B3/S29", "B3/23", "b3/s23",
          "B3/S23/", "B3/S2 3", "S23/B3", "B3//S23", "B3/S23x", "Life"}) {
        INFO("rule: '" << text << "'");
        REQUIRE_THROWS_AS(RuleSet::parse(text), celleste::RuleParseError);
    }
}

TEST_CASE("RuleParseError keeps the rule text", "[ruleset]") {
    try {
        (void)RuleSet::parse("B9/S23");
        FAIL("expected RuleParseError");
    } catch (const celleste::RuleParseError &e) {
        REQUIRE(e.rule() == "B9/S23");
        REQUIRE(std::string(e.what()).find("out of range") !=
                std::string::npos);
    }
}

TEST_CASE("RuleSet next_state applies birth and survival", "[ruleset]") {
    auto rules = RuleSet::parse("B36/S23");

    REQUIRE(rules.next_state(false, 3));
    REQUIRE(rules.next_state(false, 6));
    REQUIRE_FALSE(rules.next_state(false, 2));
    REQUIRE(rules.next_state(true, 2));
    REQUIRE_FALSE(rules.next_state(true, 6));
    REQUIRE_FALSE(rules.next_state(true, 1));

    // counts outside 0-8 are never members
    REQUIRE_FALSE(rules.is_birth(-1));
    REQUIRE_FALSE(rules.is_survive(9));
}
