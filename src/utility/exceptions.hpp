#pragma once

#include <stdexcept>
#include <string>

namespace shakerbed {

/**
 * Base exception class for all shaker bed errors
 */
class ShakerBedException : public std::runtime_error {
  public:
    explicit ShakerBedException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Exception for simulation-related errors (world construction, sequencing)
 */
class SimulationError : public ShakerBedException {
  public:
    explicit SimulationError(const std::string &message)
        : ShakerBedException("Simulation error: " + message) {}
};

/**
 * Exception for rendering-related errors
 */
class RenderError : public ShakerBedException {
  public:
    explicit RenderError(const std::string &message)
        : ShakerBedException("Render error: " + message) {}
};

/**
 * Exception for I/O operations (config file read/write, JSON parsing)
 */
class IOError : public ShakerBedException {
  public:
    explicit IOError(const std::string &message)
        : ShakerBedException("I/O error: " + message) {}
};

/**
 * Exception for configuration validation errors
 */
class ConfigError : public ShakerBedException {
  public:
    explicit ConfigError(const std::string &message)
        : ShakerBedException("Configuration error: " + message) {}
};

} // namespace shakerbed
