#pragma once

#include <array>
#include <cstdint>

/**
 * @brief Fixed tuning constants for one shaker bed instance
 *
 * Values are loaded once at startup (defaults or a JSON file) and never
 * edited while the simulation runs.
 */
struct BedConfig {
    // bed geometry
    float bed_radius = 9.0f;
    int wall_segments = 36;
    float wall_thickness = 0.1f;
    float wall_elasticity = 0.5f;
    float wall_friction = 1.5f;

    // actuators, degrees around the rim
    std::array<float, 3> actuator_angles_deg = {90.f, 210.f, 330.f};
    float lift_height = 1.5f;
    float force_factor = 100.0f;

    // pellets
    int pellet_count = 500;
    float pellet_radius = 0.2f;
    float pellet_mass = 1.0f;
    float pellet_moment = 100.0f;
    float pellet_elasticity = 0.1f;
    float pellet_friction = 1.2f;
    float linear_damping = 4.0f;
    float angular_damping = 4.0f;
    /** @brief Fraction of the bed radius covered by the Flatten pile */
    float mountain_fraction = 0.3f;

    // flatten
    int flatten_ramp_steps = 10;
    float flatten_wall_lift_dur = 1.5f;
    float flatten_ram_pulse_dur = 0.0f;
    float flatten_ram_impulse = 3.5f;
    float flatten_ram_hold_dur = 2.0f;
    float flatten_settle_dur = 2.0f;

    // scramble
    float scramble_thump_dur = 0.15f;
    float scramble_pause = 5.0f;
    float scramble_impulse = 3.0f;

    // dump
    float dump_hold_dur = 0.8f;
    float dump_impulse = 2.5f;
    int dump_cycles = 10;

    // loop
    int tick_rate = 60;
    int solver_iterations = 4;
    bool loop_animation = true;
    std::uint32_t rng_seed = 0;
    /** @brief When false the seed above is ignored and drawn from the OS */
    bool fixed_seed = false;

    /** @brief Fixed physics timestep in seconds */
    inline float dt() const noexcept { return 1.0f / float(tick_rate); }
};

/**
 * @brief Validates a configuration
 * @param cfg Configuration to check
 * @throws shakerbed::ConfigError naming the first offending field
 */
void validate_config(const BedConfig &cfg);
