#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "simulation/simulation.hpp"
#include "utility/clock.hpp"
#include "utility/exceptions.hpp"

namespace {

BedConfig small_config() {
    BedConfig cfg;
    cfg.pellet_count = 120;
    cfg.fixed_seed = true;
    cfg.rng_seed = 4242;
    return cfg;
}

// one tick at the configured rate
void tick(Simulation &sim, shakerbed::ManualClock &clock) {
    clock.advance(sim.get_config().dt());
    sim.tick();
}

std::vector<float> positions(const Simulation &sim) {
    return sim.get_frame().positions;
}

} // namespace

TEST_CASE("Simulation starts idle on a uniform pile", "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    REQUIRE(sim.get_run_state() == Simulation::RunState::Running);
    REQUIRE(sim.get_pile() == PileShape::Uniform);
    REQUIRE(sim.get_world().get_pellets_size() == 120);

    auto frame = sim.get_frame();
    REQUIRE(frame.label == "IDLE");
    REQUIRE(frame.phase == SequencerPhase::Idle);
    REQUIRE(frame.pellet_count() == 120);
    REQUIRE(frame.loop);

    tick(sim, clock);
    REQUIRE(sim.get_output().lifts == Lifts{0.f, 0.f, 0.f});
    REQUIRE(sim.get_output().impulse == 1.f);
    REQUIRE(sim.get_force().x == Catch::Approx(0.f).margin(1e-4));
    REQUIRE(sim.get_stats().num_steps == 1);
    REQUIRE(sim.get_stats().pellets == 120);
}

TEST_CASE("Invalid configuration is rejected at construction",
          "[simulation]") {
    shakerbed::ManualClock clock;
    BedConfig cfg = small_config();
    cfg.bed_radius = -1.f;
    REQUIRE_THROWS_AS(Simulation(cfg, clock), shakerbed::ConfigError);
}

TEST_CASE("Flatten runs end to end and returns to idle", "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    sim.select_gesture(Gesture::Flatten);
    tick(sim, clock);
    REQUIRE(sim.get_pile() == PileShape::Mountain);
    REQUIRE(sim.get_frame().label == "Flattening");
    REQUIRE(sim.get_frame().step_count == 13);

    bool ram_pushed = false;
    int ticks = 0;
    while (sim.get_sequencer_state().running && ticks < 2000) {
        tick(sim, clock);
        if (sim.get_output().impulse > 1.f) {
            const Vector2 f = sim.get_force();
            ram_pushed = ram_pushed || (f.x * f.x + f.y * f.y) > 0.f;
        }
        ticks++;
    }

    REQUIRE(ram_pushed);
    REQUIRE_FALSE(sim.get_sequencer_state().running);
    REQUIRE(sim.get_frame().label == "IDLE");
    REQUIRE(sim.get_world().all_finite());

    // looping is on, yet Flatten stays idle
    for (int i = 0; i < 60; ++i) {
        tick(sim, clock);
    }
    REQUIRE(sim.get_frame().phase == SequencerPhase::Idle);
}

TEST_CASE("Paused ticks freeze the sequencer and the pellets",
          "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    sim.select_gesture(Gesture::Dump);
    for (int i = 0; i < 70; ++i) {
        tick(sim, clock);
    }
    const int index_before = sim.get_sequencer_state().step_index;
    REQUIRE(index_before >= 1);

    sim.toggle_pause();
    tick(sim, clock);
    REQUIRE(sim.get_frame().paused);
    REQUIRE(sim.get_frame().phase == SequencerPhase::Paused);

    const auto frozen = positions(sim);
    const long long steps_before = sim.get_stats().num_steps;
    for (int i = 0; i < 300; ++i) {
        tick(sim, clock);
        REQUIRE(sim.get_sequencer_state().step_index == index_before);
    }
    REQUIRE(positions(sim) == frozen);
    REQUIRE(sim.get_stats().num_steps == steps_before);

    sim.toggle_pause();
    for (int i = 0; i < 60; ++i) {
        tick(sim, clock);
    }
    REQUIRE_FALSE(sim.get_frame().paused);
    REQUIRE(positions(sim) != frozen);
}

TEST_CASE("Same seed reproduces the same pile", "[simulation]") {
    shakerbed::ManualClock clock_a;
    shakerbed::ManualClock clock_b;
    Simulation a(small_config(), clock_a);
    Simulation b(small_config(), clock_b);

    REQUIRE(positions(a) == positions(b));

    a.select_gesture(Gesture::Scramble);
    b.select_gesture(Gesture::Scramble);
    tick(a, clock_a);
    tick(b, clock_b);
    REQUIRE(positions(a) == positions(b));
    REQUIRE(a.get_output().lifts == b.get_output().lifts);
}

TEST_CASE("Reset keeps the pile shape and stops the sequence",
          "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    sim.select_gesture(Gesture::Flatten);
    tick(sim, clock);
    REQUIRE(sim.get_sequencer_state().running);

    sim.reset();
    tick(sim, clock);
    REQUIRE(sim.get_pile() == PileShape::Mountain);
    REQUIRE_FALSE(sim.get_sequencer_state().running);
    REQUIRE(sim.get_frame().label == "IDLE");
    REQUIRE(sim.get_stats().num_steps == 1);
}

TEST_CASE("Pause and loop flags survive gesture selection", "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    sim.toggle_loop();
    sim.toggle_pause();
    tick(sim, clock);
    REQUIRE_FALSE(sim.get_frame().loop);
    REQUIRE(sim.get_frame().paused);

    sim.select_gesture(Gesture::Scramble);
    tick(sim, clock);
    REQUIRE_FALSE(sim.get_frame().loop);
    REQUIRE(sim.get_frame().paused);
    REQUIRE(sim.get_frame().step_index == 0);

    // the sequence waits at its first step until resumed
    for (int i = 0; i < 30; ++i) {
        tick(sim, clock);
    }
    REQUIRE(sim.get_sequencer_state().step_index == 0);
}

TEST_CASE("Quit stops ticking", "[simulation]") {
    shakerbed::ManualClock clock;
    Simulation sim(small_config(), clock);

    tick(sim, clock);
    const long long ticks = sim.get_total_ticks();

    sim.quit();
    sim.select_gesture(Gesture::Dump);
    tick(sim, clock);
    REQUIRE(sim.get_run_state() == Simulation::RunState::Quit);
    REQUIRE(sim.get_total_ticks() == ticks);
    REQUIRE_FALSE(sim.get_sequencer_state().running);
}

TEST_CASE("ManualClock only moves forward when told", "[simulation]") {
    shakerbed::ManualClock clock(2.0);
    REQUIRE(clock.now() == 2.0);
    clock.advance(0.5);
    clock.advance(-10.0);
    REQUIRE(clock.now() == Catch::Approx(2.5));
    clock.set(1.0);
    REQUIRE(clock.now() == 1.0);
}
