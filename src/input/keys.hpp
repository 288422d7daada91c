#pragma once

#include "key_manager.hpp"

#include "config_manager.hpp"
#include "render/types/config.hpp"
#include "simulation/simulation.hpp"

/**
 * @brief Sets up all keyboard shortcuts for the application.
 *
 * Registers gesture selection, pause/loop/reset, UI toggles, camera orbit
 * and saving the configuration.
 *
 * @param key_manager The KeyManager instance to register handlers with
 * @param sim The simulation receiving commands
 * @param rcfg The render configuration for UI toggles and camera controls
 * @param config_manager Used to save the active configuration
 * @param should_exit Reference to boolean flag to set when exit is requested
 */
void setup_keys(KeyManager &key_manager, Simulation &sim, Config &rcfg,
                ConfigManager &config_manager, bool &should_exit);
