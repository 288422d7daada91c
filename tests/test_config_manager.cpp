#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

#include "config_manager.hpp"
#include "utility/exceptions.hpp"

namespace {

std::string temp_path(const std::string &name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

void write_file(const std::string &path, const std::string &text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST_CASE("ConfigManager - save and load", "[config_manager]") {
    ConfigManager manager;
    const std::string path = temp_path("shakerbed_roundtrip.json");

    BedConfig cfg;
    cfg.pellet_count = 321;
    cfg.actuator_angles_deg = {0.f, 120.f, 240.f};
    cfg.dump_cycles = 4;
    cfg.loop_animation = false;
    cfg.fixed_seed = true;
    cfg.rng_seed = 99;
    cfg.scramble_impulse = 4.5f;

    REQUIRE_NOTHROW(manager.save_config(path, cfg));
    REQUIRE(std::filesystem::exists(path));

    const BedConfig loaded = manager.load_config(path);
    REQUIRE(loaded.pellet_count == 321);
    REQUIRE(loaded.actuator_angles_deg[1] == Catch::Approx(120.f));
    REQUIRE(loaded.dump_cycles == 4);
    REQUIRE_FALSE(loaded.loop_animation);
    REQUIRE(loaded.fixed_seed);
    REQUIRE(loaded.rng_seed == 99u);
    REQUIRE(loaded.scramble_impulse == Catch::Approx(4.5f));
    REQUIRE(loaded.bed_radius == Catch::Approx(9.f));

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - missing keys keep defaults", "[config_manager]") {
    ConfigManager manager;
    const std::string path = temp_path("shakerbed_partial.json");
    write_file(path, R"({"pellets": {"count": 42}, "dump": {"cycles": 2}})");

    const BedConfig cfg = manager.load_config(path);
    REQUIRE(cfg.pellet_count == 42);
    REQUIRE(cfg.dump_cycles == 2);
    REQUIRE(cfg.pellet_radius == Catch::Approx(0.2f));
    REQUIRE(cfg.force_factor == Catch::Approx(100.f));
    REQUIRE(cfg.tick_rate == 60);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - error handling", "[config_manager]") {
    ConfigManager manager;

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(
            manager.load_config(temp_path("shakerbed_does_not_exist.json")),
            shakerbed::IOError);
    }

    SECTION("Malformed JSON") {
        const std::string path = temp_path("shakerbed_malformed.json");
        write_file(path, "{ \"bed\": { \"radius\": ");
        REQUIRE_THROWS_AS(manager.load_config(path), shakerbed::IOError);
        std::filesystem::remove(path);
    }

    SECTION("Wrong value type") {
        const std::string path = temp_path("shakerbed_badtype.json");
        write_file(path, R"({"bed": {"radius": "large"}})");
        REQUIRE_THROWS_AS(manager.load_config(path), shakerbed::IOError);
        std::filesystem::remove(path);
    }

    SECTION("Invalid value") {
        const std::string path = temp_path("shakerbed_invalid.json");
        write_file(path, R"({"pellets": {"radius": -0.5}})");
        REQUIRE_THROWS_AS(manager.load_config(path), shakerbed::ConfigError);
        std::filesystem::remove(path);
    }

    SECTION("Unwritable destination") {
        REQUIRE_THROWS_AS(
            manager.save_config(temp_path("no_such_dir/nested/cfg.json"),
                                BedConfig{}),
            shakerbed::IOError);
    }
}

TEST_CASE("ConfigManager - defaults when no file exists",
          "[config_manager]") {
    ConfigManager manager;
    const BedConfig cfg =
        manager.load_or_default(temp_path("shakerbed_absent.json"));
    REQUIRE(cfg.pellet_count == 500);
    REQUIRE(cfg.lift_height == Catch::Approx(1.5f));
}

TEST_CASE("ConfigManager - JSON layout", "[config_manager]") {
    ConfigManager manager;
    const json j = manager.bed_config_to_json(BedConfig{});
    REQUIRE(j.contains("bed"));
    REQUIRE(j.contains("actuators"));
    REQUIRE(j.contains("flatten"));
    REQUIRE(j["pellets"]["count"] == 500);
    REQUIRE(j["actuators"]["angles_deg"].size() == 3);

    json edited = j;
    edited["scramble"]["pause"] = 1.25;
    const BedConfig back = manager.json_to_bed_config(edited);
    REQUIRE(back.scramble_pause == Catch::Approx(1.25f));
}
