#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "../utility/random.hpp"
#include "bed_config.hpp"
#include "seeder.hpp"
#include "tilt.hpp"

/**
 * @brief Named animation intents
 */
enum class Gesture { Flatten, Scramble, Dump };

/**
 * @brief What happens once the last step of a sequence has elapsed
 */
enum class LoopPolicy {
    /** @brief Always return to idle, whatever the loop flag says */
    OneShot,
    /** @brief Restart from step 0 while looping is enabled */
    Repeat
};

/**
 * @brief One timed actuator pose
 */
struct AnimationStep {
    /** @brief Actuator target heights held for the whole step */
    Lifts lifts = {0.f, 0.f, 0.f};
    /** @brief Seconds the step stays active */
    float duration = 0.f;
    /** @brief Force multiplier while the step is active */
    float impulse = 1.f;
};

/**
 * @brief Ordered list of steps produced for one gesture
 */
struct AnimationSequence {
    Gesture gesture = Gesture::Flatten;
    LoopPolicy policy = LoopPolicy::OneShot;
    /** @brief Build a fresh sequence (new random draws) on every loop */
    bool regenerate_on_loop = false;
    std::vector<AnimationStep> steps;

    inline int size() const noexcept { return (int)steps.size(); }
    inline bool empty() const noexcept { return steps.empty(); }
};

using SequencePtr = std::shared_ptr<const AnimationSequence>;

std::string_view gesture_name(Gesture gesture) noexcept;

/**
 * @brief Label shown while the gesture is animating ("Flattening", ...)
 */
std::string_view gesture_activity(Gesture gesture) noexcept;

/**
 * @brief Initial pile each gesture starts from
 */
PileShape gesture_pile(Gesture gesture) noexcept;

namespace gestures {

/**
 * @brief Walls rise on actuators 1 and 2, actuator 0 rams the pile flat, then
 * the bed settles level.
 *
 * Steps: flatten_ramp_steps ramp steps, a ram pulse at flatten_ram_impulse,
 * a hold, and a flat settle step. One-shot.
 */
AnimationSequence make_flatten(const BedConfig &cfg);

/**
 * @brief A short hard thump on one randomly chosen actuator followed by a
 * long flat pause. Regenerated on every loop.
 */
AnimationSequence make_scramble(const BedConfig &cfg,
                                shakerbed::RandomSource &rng);

/**
 * @brief Round-robin lift of actuators 0, 1, 2, repeated @p cycles times.
 */
AnimationSequence make_dump(const BedConfig &cfg, int cycles);

/**
 * @brief Builds the sequence for a gesture
 */
SequencePtr make_sequence(Gesture gesture, const BedConfig &cfg,
                          shakerbed::RandomSource &rng);

} // namespace gestures
