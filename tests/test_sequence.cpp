#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "simulation/sequence.hpp"

TEST_CASE("Flatten ramps the walls then rams", "[sequence]") {
    BedConfig cfg;
    const AnimationSequence seq = gestures::make_flatten(cfg);

    REQUIRE(seq.gesture == Gesture::Flatten);
    REQUIRE(seq.policy == LoopPolicy::OneShot);
    REQUIRE(seq.size() == 13);

    for (int i = 0; i < 10; ++i) {
        const AnimationStep &s = seq.steps[i];
        const float lift = float(i + 1) / 10.f * cfg.lift_height;
        REQUIRE(s.lifts[0] == 0.f);
        REQUIRE(s.lifts[1] == Catch::Approx(lift));
        REQUIRE(s.lifts[2] == Catch::Approx(lift));
        REQUIRE(s.duration == Catch::Approx(0.15f));
        REQUIRE(s.impulse == 1.f);
    }

    const AnimationStep &ram = seq.steps[10];
    REQUIRE(ram.lifts == Lifts{cfg.lift_height, 0.f, 0.f});
    REQUIRE(ram.duration == 0.f);
    REQUIRE(ram.impulse == Catch::Approx(3.5f));

    const AnimationStep &hold = seq.steps[11];
    REQUIRE(hold.lifts == Lifts{cfg.lift_height, 0.f, 0.f});
    REQUIRE(hold.duration == Catch::Approx(2.f));
    REQUIRE(hold.impulse == 1.f);

    const AnimationStep &settle = seq.steps[12];
    REQUIRE(settle.lifts == Lifts{0.f, 0.f, 0.f});
    REQUIRE(settle.duration == Catch::Approx(2.f));
}

TEST_CASE("Scramble thumps one actuator then pauses", "[sequence]") {
    BedConfig cfg;
    shakerbed::RandomSource rng(7);
    const AnimationSequence seq = gestures::make_scramble(cfg, rng);

    REQUIRE(seq.policy == LoopPolicy::Repeat);
    REQUIRE(seq.regenerate_on_loop);
    REQUIRE(seq.size() == 2);

    int lifted = 0;
    for (float h : seq.steps[0].lifts) {
        if (h > 0.f) {
            REQUIRE(h == Catch::Approx(cfg.lift_height));
            lifted++;
        }
    }
    REQUIRE(lifted == 1);
    REQUIRE(seq.steps[0].duration == Catch::Approx(0.15f));
    REQUIRE(seq.steps[0].impulse == Catch::Approx(3.f));

    REQUIRE(seq.steps[1].lifts == Lifts{0.f, 0.f, 0.f});
    REQUIRE(seq.steps[1].duration == Catch::Approx(5.f));
    REQUIRE(seq.steps[1].impulse == 1.f);
}

TEST_CASE("Dump pushes each actuator in turn", "[sequence]") {
    BedConfig cfg;
    const AnimationSequence seq = gestures::make_dump(cfg, 10);

    REQUIRE(seq.policy == LoopPolicy::Repeat);
    REQUIRE_FALSE(seq.regenerate_on_loop);
    REQUIRE(seq.size() == 30);

    for (int i = 0; i < seq.size(); ++i) {
        const AnimationStep &s = seq.steps[i];
        Lifts expected = {0.f, 0.f, 0.f};
        expected[i % 3] = cfg.lift_height;
        REQUIRE(s.lifts == expected);
        REQUIRE(s.duration == Catch::Approx(0.8f));
        REQUIRE(s.impulse == Catch::Approx(2.5f));
    }

    REQUIRE(gestures::make_dump(cfg, 0).empty());
}

TEST_CASE("Gesture metadata", "[sequence]") {
    REQUIRE(gesture_name(Gesture::Scramble) == "Scramble");
    REQUIRE(gesture_activity(Gesture::Flatten) == "Flattening");
    REQUIRE(gesture_activity(Gesture::Dump) == "Dumping");
    REQUIRE(gesture_pile(Gesture::Flatten) == PileShape::Mountain);
    REQUIRE(gesture_pile(Gesture::Scramble) == PileShape::Uniform);
    REQUIRE(gesture_pile(Gesture::Dump) == PileShape::Uniform);

    BedConfig cfg;
    shakerbed::RandomSource rng(1);
    auto dump = gestures::make_sequence(Gesture::Dump, cfg, rng);
    REQUIRE(dump);
    REQUIRE(dump->size() == cfg.dump_cycles * 3);
}

TEST_CASE("Negative lift heights are clamped", "[sequence]") {
    BedConfig cfg;
    cfg.lift_height = -1.f;
    for (const AnimationStep &s : gestures::make_flatten(cfg).steps) {
        for (float h : s.lifts) {
            REQUIRE(h >= 0.f);
        }
    }
}
