#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "simulation/bed_config.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using json = nlohmann::json;

/**
 * @brief Loads and saves the bed configuration as JSON.
 *
 * Files are grouped by concern ("bed", "actuators", "pellets", "flatten",
 * "scramble", "dump", "loop"). Keys missing from a file keep their default
 * value, so a file only needs to name what it changes.
 */
class ConfigManager {
  public:
    /** @brief Configuration file looked up in the working directory */
    static constexpr const char *DEFAULT_CONFIG_FILE = "shakerbed.json";

    ConfigManager() = default;
    ~ConfigManager() = default;

    // Delete copy and move semantics
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;
    ConfigManager(ConfigManager &&) = delete;
    ConfigManager &operator=(ConfigManager &&) = delete;

    /**
     * @brief Load a configuration, merging present keys over the defaults.
     * @param filepath Path to the JSON file
     * @return Validated configuration
     * @throws shakerbed::IOError if the file cannot be read or parsed
     * @throws shakerbed::ConfigError if the merged values are invalid
     */
    BedConfig load_config(const std::string &filepath) const;

    /**
     * @brief Save a configuration, writing every key.
     * @param filepath Destination path
     * @param cfg Configuration to serialize
     * @throws shakerbed::IOError if the file cannot be written
     */
    void save_config(const std::string &filepath, const BedConfig &cfg) const;

    /**
     * @brief Load the default file if it exists, otherwise use defaults.
     * @throws shakerbed::IOError if the file exists but cannot be parsed
     * @throws shakerbed::ConfigError if its values are invalid
     */
    BedConfig load_or_default(const std::string &filepath) const;

    json bed_config_to_json(const BedConfig &cfg) const;

    /**
     * @brief Apply the keys present in j on top of base.
     * @throws json::exception on type mismatches
     */
    BedConfig json_to_bed_config(const json &j,
                                 const BedConfig &base = {}) const;
};
