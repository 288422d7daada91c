#include "bed_config.hpp"

#include <cmath>
#include <string>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"

namespace {

void require_positive(float value, const char *name) {
    if (!std::isfinite(value) || value <= 0.f) {
        throw shakerbed::ConfigError(
            fmt::format("{} must be positive, got {}", name, value));
    }
}

void require_non_negative(float value, const char *name) {
    if (!std::isfinite(value) || value < 0.f) {
        throw shakerbed::ConfigError(
            fmt::format("{} must not be negative, got {}", name, value));
    }
}

} // namespace

void validate_config(const BedConfig &cfg) {
    require_positive(cfg.bed_radius, "bed_radius");
    require_positive(cfg.pellet_radius, "pellet_radius");
    require_positive(cfg.pellet_mass, "pellet_mass");
    require_positive(cfg.pellet_moment, "pellet_moment");
    require_positive(cfg.flatten_wall_lift_dur, "flatten_wall_lift_dur");
    require_positive(cfg.scramble_thump_dur, "scramble_thump_dur");
    require_positive(cfg.dump_hold_dur, "dump_hold_dur");

    require_non_negative(cfg.wall_thickness, "wall_thickness");
    require_non_negative(cfg.wall_elasticity, "wall_elasticity");
    require_non_negative(cfg.wall_friction, "wall_friction");
    require_non_negative(cfg.pellet_elasticity, "pellet_elasticity");
    require_non_negative(cfg.pellet_friction, "pellet_friction");
    require_non_negative(cfg.linear_damping, "linear_damping");
    require_non_negative(cfg.angular_damping, "angular_damping");
    require_non_negative(cfg.lift_height, "lift_height");
    require_non_negative(cfg.force_factor, "force_factor");
    require_non_negative(cfg.flatten_ram_pulse_dur, "flatten_ram_pulse_dur");
    require_non_negative(cfg.flatten_ram_impulse, "flatten_ram_impulse");
    require_non_negative(cfg.flatten_ram_hold_dur, "flatten_ram_hold_dur");
    require_non_negative(cfg.flatten_settle_dur, "flatten_settle_dur");
    require_non_negative(cfg.scramble_pause, "scramble_pause");
    require_non_negative(cfg.scramble_impulse, "scramble_impulse");
    require_non_negative(cfg.dump_impulse, "dump_impulse");

    if (!(cfg.mountain_fraction > 0.f && cfg.mountain_fraction <= 1.f)) {
        throw shakerbed::ConfigError(fmt::format(
            "mountain_fraction must be in (0, 1], got {}",
            cfg.mountain_fraction));
    }

    if (cfg.pellet_radius * 2.f >= cfg.bed_radius) {
        throw shakerbed::ConfigError(
            fmt::format("pellet_radius {} does not fit a bed of radius {}",
                        cfg.pellet_radius, cfg.bed_radius));
    }

    if (cfg.pellet_count < 0) {
        throw shakerbed::ConfigError("Invalid pellet count: " +
                                     std::to_string(cfg.pellet_count));
    }

    if (cfg.wall_segments < 3) {
        throw shakerbed::ConfigError("Invalid wall segment count: " +
                                     std::to_string(cfg.wall_segments));
    }

    if (cfg.flatten_ramp_steps < 1) {
        throw shakerbed::ConfigError("Invalid flatten ramp step count: " +
                                     std::to_string(cfg.flatten_ramp_steps));
    }

    if (cfg.dump_cycles < 1) {
        throw shakerbed::ConfigError("Invalid dump cycle count: " +
                                     std::to_string(cfg.dump_cycles));
    }

    if (cfg.tick_rate <= 0) {
        throw shakerbed::ConfigError("Invalid tick rate: " +
                                     std::to_string(cfg.tick_rate));
    }

    if (cfg.solver_iterations < 1) {
        throw shakerbed::ConfigError("Invalid solver iteration count: " +
                                     std::to_string(cfg.solver_iterations));
    }

    for (float angle : cfg.actuator_angles_deg) {
        if (!std::isfinite(angle)) {
            throw shakerbed::ConfigError("Actuator angle is not finite");
        }
    }
}
