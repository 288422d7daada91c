#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

#include "simulation/bed_config.hpp"
#include "utility/exceptions.hpp"

TEST_CASE("Default configuration is valid", "[bed_config]") {
    BedConfig cfg;
    REQUIRE_NOTHROW(validate_config(cfg));
    REQUIRE(cfg.dt() == Catch::Approx(1.f / 60.f));
    REQUIRE(cfg.pellet_count == 500);
    REQUIRE(cfg.wall_segments == 36);
    REQUIRE(cfg.actuator_angles_deg[2] == Catch::Approx(330.f));
}

TEST_CASE("Invalid configurations are rejected", "[bed_config]") {
    BedConfig cfg;

    SECTION("Non-positive bed radius") {
        cfg.bed_radius = 0.f;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Pellet too large for the bed") {
        cfg.pellet_radius = 5.f;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Negative pellet count") {
        cfg.pellet_count = -1;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Too few wall segments") {
        cfg.wall_segments = 2;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Negative friction") {
        cfg.pellet_friction = -0.1f;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Mountain fraction out of range") {
        cfg.mountain_fraction = 1.5f;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
        cfg.mountain_fraction = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Zero tick rate") {
        cfg.tick_rate = 0;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("No solver iterations") {
        cfg.solver_iterations = 0;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("No dump cycles") {
        cfg.dump_cycles = 0;
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Non-finite actuator angle") {
        cfg.actuator_angles_deg[1] = std::numeric_limits<float>::infinity();
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }

    SECTION("Non-finite force factor") {
        cfg.force_factor = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_THROWS_AS(validate_config(cfg), shakerbed::ConfigError);
    }
}

TEST_CASE("Zero pellets and zero pulse are allowed", "[bed_config]") {
    BedConfig cfg;
    cfg.pellet_count = 0;
    cfg.flatten_ram_pulse_dur = 0.f;
    REQUIRE_NOTHROW(validate_config(cfg));
}

TEST_CASE("Exceptions carry their category prefix", "[bed_config]") {
    BedConfig cfg;
    cfg.tick_rate = -5;
    try {
        validate_config(cfg);
        FAIL("validate_config accepted a negative tick rate");
    } catch (const shakerbed::ShakerBedException &e) {
        REQUIRE(std::string(e.what()).rfind("Configuration error: ", 0) ==
                0);
    }
}
