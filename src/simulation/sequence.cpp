#include "sequence.hpp"

#include <algorithm>

std::string_view gesture_name(Gesture gesture) noexcept {
    switch (gesture) {
    case Gesture::Flatten:
        return "Flatten";
    case Gesture::Scramble:
        return "Scramble";
    case Gesture::Dump:
        return "Dump";
    }
    return "Unknown";
}

std::string_view gesture_activity(Gesture gesture) noexcept {
    switch (gesture) {
    case Gesture::Flatten:
        return "Flattening";
    case Gesture::Scramble:
        return "Scrambling";
    case Gesture::Dump:
        return "Dumping";
    }
    return "Unknown";
}

PileShape gesture_pile(Gesture gesture) noexcept {
    return gesture == Gesture::Flatten ? PileShape::Mountain
                                       : PileShape::Uniform;
}

namespace gestures {

AnimationSequence make_flatten(const BedConfig &cfg) {
    AnimationSequence seq;
    seq.gesture = Gesture::Flatten;
    seq.policy = LoopPolicy::OneShot;

    const float height = std::max(0.f, cfg.lift_height);
    const int ramp_steps = std::max(1, cfg.flatten_ramp_steps);
    const float ramp_dur = cfg.flatten_wall_lift_dur / float(ramp_steps);

    seq.steps.reserve(ramp_steps + 3);
    for (int i = 0; i < ramp_steps; ++i) {
        const float lift = float(i + 1) / float(ramp_steps) * height;
        seq.steps.push_back({{0.f, lift, lift}, ramp_dur});
    }
    seq.steps.push_back({{height, 0.f, 0.f},
                         cfg.flatten_ram_pulse_dur,
                         cfg.flatten_ram_impulse});
    seq.steps.push_back({{height, 0.f, 0.f}, cfg.flatten_ram_hold_dur});
    seq.steps.push_back({{0.f, 0.f, 0.f}, cfg.flatten_settle_dur});

    return seq;
}

AnimationSequence make_scramble(const BedConfig &cfg,
                                shakerbed::RandomSource &rng) {
    AnimationSequence seq;
    seq.gesture = Gesture::Scramble;
    seq.policy = LoopPolicy::Repeat;
    seq.regenerate_on_loop = true;

    Lifts thump = {0.f, 0.f, 0.f};
    thump[rng.uniform_int(0, 2)] = std::max(0.f, cfg.lift_height);

    seq.steps.push_back({thump, cfg.scramble_thump_dur, cfg.scramble_impulse});
    seq.steps.push_back({{0.f, 0.f, 0.f}, cfg.scramble_pause});

    return seq;
}

AnimationSequence make_dump(const BedConfig &cfg, int cycles) {
    AnimationSequence seq;
    seq.gesture = Gesture::Dump;
    seq.policy = LoopPolicy::Repeat;

    const float height = std::max(0.f, cfg.lift_height);
    const int n = std::max(0, cycles);
    seq.steps.reserve(size_t(n) * 3);
    for (int c = 0; c < n; ++c) {
        for (int actuator = 0; actuator < 3; ++actuator) {
            Lifts push = {0.f, 0.f, 0.f};
            push[actuator] = height;
            seq.steps.push_back({push, cfg.dump_hold_dur, cfg.dump_impulse});
        }
    }

    return seq;
}

SequencePtr make_sequence(Gesture gesture, const BedConfig &cfg,
                          shakerbed::RandomSource &rng) {
    switch (gesture) {
    case Gesture::Flatten:
        return std::make_shared<const AnimationSequence>(make_flatten(cfg));
    case Gesture::Scramble:
        return std::make_shared<const AnimationSequence>(
            make_scramble(cfg, rng));
    case Gesture::Dump:
        return std::make_shared<const AnimationSequence>(
            make_dump(cfg, cfg.dump_cycles));
    }
    return nullptr;
}

} // namespace gestures
