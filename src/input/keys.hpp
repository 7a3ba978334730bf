#pragma once

#include <string>

#include "key_manager.hpp"

#include "../render/types/config.hpp"
#include "../simulation/command.hpp"
#include "../simulation/engine.hpp"

/**
 * @brief Sets up all keyboard shortcuts for the application.
 *
 * Simulation actions are pushed onto the command queue; view toggles and
 * camera movement change the render configuration directly.
 *
 * @param key_manager The KeyManager instance to register handlers with
 * @param engine Engine, read to decide whether single steps are allowed
 * @param commands Queue drained by the frame loop
 * @param rcfg The render configuration for UI toggles and camera controls
 * @param save_file Target of the save and load keys
 * @param should_exit Reference to boolean flag to set when exit is requested
 */
void setup_keys(KeyManager &key_manager, const Engine &engine,
                command::Queue &commands, Config &rcfg,
                const std::string &save_file, bool &should_exit);
