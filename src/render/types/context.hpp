#pragma once

#include <utility>

#include "../../config_manager.hpp"
#include "../../mailbox/data_snapshot.hpp"
#include "../../simulation/simulation.hpp"
#include "config.hpp"
#include "window.hpp"

// per-frame context passed to renderers
struct Context {
    Simulation &sim;
    Config &rcfg;
    const WindowConfig &wcfg;

    // Snapshots published by the last tick
    mailbox::FrameSnapshot frame;
    mailbox::SimulationStatsSnapshot stats;

    ConfigManager &config;

    bool should_exit = false;

    Context(Simulation &sim, Config &rcfg, const WindowConfig &wcfg,
            mailbox::FrameSnapshot frame,
            mailbox::SimulationStatsSnapshot stats, ConfigManager &config)
        : sim(sim), rcfg(rcfg), wcfg(wcfg), frame(std::move(frame)),
          stats(stats), config(config) {}
};
