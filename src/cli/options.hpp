#pragma once

#include <optional>
#include <string>

#include "../simulation/engine_config.hpp"
#include "../simulation/ruleset.hpp"

namespace cli {

constexpr const char *DEFAULT_SAVE_FILE = "./celleste_save.cel";

/**
 * @brief Everything the command line can set.
 */
struct AppOptions {
    /** @brief Rule text, parsed by the caller so it can report it */
    std::string rules = RuleSet::DEFAULT_RULE;
    /** @brief Target of the save and load keys */
    std::string save_file = DEFAULT_SAVE_FILE;
    /** @brief Save file loaded at startup */
    std::optional<std::string> load_file;
    EngineConfig engine;
    bool show_help = false;
};

/**
 * @brief Parses argv. Accepts the rule as the only positional argument or
 * through --rules, not both.
 * @throws celleste::ConfigError on unknown options, missing or malformed
 * values and values rejected by validate_config
 */
AppOptions parse_options(int argc, char **argv);

/**
 * @brief Help text listing every option and its default.
 */
std::string usage(const char *prog);

} // namespace cli
