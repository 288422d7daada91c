#include <filesystem>
#include <fstream>

#include <fmt/format.h>

#include "config_manager.hpp"

namespace {

template <typename T>
void read_if(const json &section, const char *key, T &out) {
    if (section.contains(key)) {
        out = section.at(key).get<T>();
    }
}

} // namespace

BedConfig ConfigManager::load_config(const std::string &filepath) const {
    LOG_INFO("Loading configuration from: " + filepath);

    BedConfig cfg;
    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw shakerbed::IOError("Failed to open file for reading: " +
                                     filepath);
        }

        json j;
        file >> j;
        file.close();

        cfg = json_to_bed_config(j);
    } catch (const shakerbed::IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON parsing error: " + std::string(e.what()));
        throw shakerbed::IOError("JSON parsing failed: " +
                                 std::string(e.what()));
    }

    validate_config(cfg);
    LOG_INFO("Configuration loaded successfully");
    return cfg;
}

void ConfigManager::save_config(const std::string &filepath,
                                const BedConfig &cfg) const {
    LOG_INFO("Saving configuration to: " + filepath);

    try {
        const json j = bed_config_to_json(cfg);

        std::ofstream file(filepath);
        if (!file.is_open()) {
            throw shakerbed::IOError("Failed to open file for writing: " +
                                     filepath);
        }

        file << j.dump(2);
        file.close();
    } catch (const shakerbed::IOError &) {
        throw;
    } catch (const std::exception &e) {
        LOG_ERROR("JSON serialization error: " + std::string(e.what()));
        throw shakerbed::IOError("JSON serialization failed: " +
                                 std::string(e.what()));
    }
}

BedConfig ConfigManager::load_or_default(const std::string &filepath) const {
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec)) {
        LOG_INFO(fmt::format("No {} found, using defaults", filepath));
        return BedConfig{};
    }
    return load_config(filepath);
}

json ConfigManager::bed_config_to_json(const BedConfig &cfg) const {
    json j;

    j["bed"] = {{"radius", cfg.bed_radius},
                {"wall_segments", cfg.wall_segments},
                {"wall_thickness", cfg.wall_thickness},
                {"wall_elasticity", cfg.wall_elasticity},
                {"wall_friction", cfg.wall_friction}};

    j["actuators"] = {{"angles_deg", cfg.actuator_angles_deg},
                      {"lift_height", cfg.lift_height},
                      {"force_factor", cfg.force_factor}};

    j["pellets"] = {{"count", cfg.pellet_count},
                    {"radius", cfg.pellet_radius},
                    {"mass", cfg.pellet_mass},
                    {"moment", cfg.pellet_moment},
                    {"elasticity", cfg.pellet_elasticity},
                    {"friction", cfg.pellet_friction},
                    {"linear_damping", cfg.linear_damping},
                    {"angular_damping", cfg.angular_damping},
                    {"mountain_fraction", cfg.mountain_fraction}};

    j["flatten"] = {{"ramp_steps", cfg.flatten_ramp_steps},
                    {"wall_lift_dur", cfg.flatten_wall_lift_dur},
                    {"ram_pulse_dur", cfg.flatten_ram_pulse_dur},
                    {"ram_impulse", cfg.flatten_ram_impulse},
                    {"ram_hold_dur", cfg.flatten_ram_hold_dur},
                    {"settle_dur", cfg.flatten_settle_dur}};

    j["scramble"] = {{"thump_dur", cfg.scramble_thump_dur},
                     {"pause", cfg.scramble_pause},
                     {"impulse", cfg.scramble_impulse}};

    j["dump"] = {{"hold_dur", cfg.dump_hold_dur},
                 {"impulse", cfg.dump_impulse},
                 {"cycles", cfg.dump_cycles}};

    j["loop"] = {{"tick_rate", cfg.tick_rate},
                 {"solver_iterations", cfg.solver_iterations},
                 {"loop_animation", cfg.loop_animation},
                 {"rng_seed", cfg.rng_seed},
                 {"fixed_seed", cfg.fixed_seed}};

    return j;
}

BedConfig ConfigManager::json_to_bed_config(const json &j,
                                            const BedConfig &base) const {
    BedConfig cfg = base;

    if (j.contains("bed")) {
        const json &s = j.at("bed");
        read_if(s, "radius", cfg.bed_radius);
        read_if(s, "wall_segments", cfg.wall_segments);
        read_if(s, "wall_thickness", cfg.wall_thickness);
        read_if(s, "wall_elasticity", cfg.wall_elasticity);
        read_if(s, "wall_friction", cfg.wall_friction);
    }

    if (j.contains("actuators")) {
        const json &s = j.at("actuators");
        read_if(s, "angles_deg", cfg.actuator_angles_deg);
        read_if(s, "lift_height", cfg.lift_height);
        read_if(s, "force_factor", cfg.force_factor);
    }

    if (j.contains("pellets")) {
        const json &s = j.at("pellets");
        read_if(s, "count", cfg.pellet_count);
        read_if(s, "radius", cfg.pellet_radius);
        read_if(s, "mass", cfg.pellet_mass);
        read_if(s, "moment", cfg.pellet_moment);
        read_if(s, "elasticity", cfg.pellet_elasticity);
        read_if(s, "friction", cfg.pellet_friction);
        read_if(s, "linear_damping", cfg.linear_damping);
        read_if(s, "angular_damping", cfg.angular_damping);
        read_if(s, "mountain_fraction", cfg.mountain_fraction);
    }

    if (j.contains("flatten")) {
        const json &s = j.at("flatten");
        read_if(s, "ramp_steps", cfg.flatten_ramp_steps);
        read_if(s, "wall_lift_dur", cfg.flatten_wall_lift_dur);
        read_if(s, "ram_pulse_dur", cfg.flatten_ram_pulse_dur);
        read_if(s, "ram_impulse", cfg.flatten_ram_impulse);
        read_if(s, "ram_hold_dur", cfg.flatten_ram_hold_dur);
        read_if(s, "settle_dur", cfg.flatten_settle_dur);
    }

    if (j.contains("scramble")) {
        const json &s = j.at("scramble");
        read_if(s, "thump_dur", cfg.scramble_thump_dur);
        read_if(s, "pause", cfg.scramble_pause);
        read_if(s, "impulse", cfg.scramble_impulse);
    }

    if (j.contains("dump")) {
        const json &s = j.at("dump");
        read_if(s, "hold_dur", cfg.dump_hold_dur);
        read_if(s, "impulse", cfg.dump_impulse);
        read_if(s, "cycles", cfg.dump_cycles);
    }

    if (j.contains("loop")) {
        const json &s = j.at("loop");
        read_if(s, "tick_rate", cfg.tick_rate);
        read_if(s, "solver_iterations", cfg.solver_iterations);
        read_if(s, "loop_animation", cfg.loop_animation);
        read_if(s, "rng_seed", cfg.rng_seed);
        read_if(s, "fixed_seed", cfg.fixed_seed);
    }

    return cfg;
}
