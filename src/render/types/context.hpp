#pragma once

#include <string>

#include "../../save_manager.hpp"
#include "../../simulation/command.hpp"
#include "../../simulation/engine.hpp"
#include "config.hpp"

// per-frame context passed to renderers
struct Context {
    // read-only view of the simulation; UI actions go through commands
    const Engine &engine;
    command::Queue &commands;
    SaveManager &save;

    Config &rcfg;
    const WindowConfig &wcfg;

    // target of the save and load actions
    const std::string &save_file;
    // last status or error line
    const std::string &status;

    bool should_exit = false;

    Context(const Engine &engine, command::Queue &commands, SaveManager &save,
            Config &rcfg, const WindowConfig &wcfg,
            const std::string &save_file, const std::string &status)
        : engine(engine), commands(commands), save(save), rcfg(rcfg),
          wcfg(wcfg), save_file(save_file), status(status) {}
};
