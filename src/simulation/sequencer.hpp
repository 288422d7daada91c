#pragma once

#include "../utility/random.hpp"
#include "bed_config.hpp"
#include "sequence.hpp"
#include "tilt.hpp"

/**
 * @brief Actuator pose and force multiplier the bed should hold this tick
 */
struct StepOutput {
    Lifts lifts = {0.f, 0.f, 0.f};
    float impulse = 1.f;
};

/**
 * @brief Coarse state of the sequencer, derived from SequencerState
 */
enum class SequencerPhase { Idle, Running, Paused };

/**
 * @brief Complete sequencer state for one tick.
 *
 * Plain value: every operation in the sequencer namespace takes a state and
 * returns the next one, nothing is mutated in place.
 */
struct SequencerState {
    /** @brief Active sequence; null while idle */
    SequencePtr sequence;
    /** @brief Index of the active step, -1 before the first step */
    int step_index = -1;
    /** @brief Clock time at which the active step began */
    double step_start = 0.0;
    /** @brief True while a sequence is being played */
    bool running = false;
    /** @brief True while time and physics are frozen */
    bool paused = false;
    /** @brief Seconds of the active step already played when pausing */
    double paused_elapsed = 0.0;
    /** @brief Whether repeatable sequences restart after their last step */
    bool loop = true;

    /**
     * @brief Active step, or nullptr when idle or out of range
     */
    const AnimationStep *current_step() const noexcept;
};

namespace sequencer {

SequencerPhase phase(const SequencerState &state) noexcept;

/**
 * @brief Begins playing a sequence at step 0.
 *
 * A null or empty sequence yields an idle state. The pause flag is carried
 * over, so a sequence started while paused waits at its first step.
 *
 * @param sequence Sequence to play
 * @param now Current clock time
 * @param loop Loop flag
 * @param paused Pause flag
 */
SequencerState start(SequencePtr sequence, double now, bool loop,
                     bool paused = false);

/**
 * @brief Moves to the next step once the active one has run longer than its
 * duration.
 *
 * At most one step boundary is crossed per call. When the last step expires
 * the sequence restarts (regenerating it if it asks for that) when looping
 * is on and its policy allows, otherwise the state goes idle. Flatten never
 * restarts.
 *
 * @param state Current state
 * @param now Current clock time
 * @param cfg Configuration used when a sequence is regenerated
 * @param rng Random source used when a sequence is regenerated
 * @return Next state
 */
SequencerState advance(const SequencerState &state, double now,
                       const BedConfig &cfg, shakerbed::RandomSource &rng);

/**
 * @brief Freezes or resumes step timing; the active step resumes exactly
 * where it stopped.
 */
SequencerState toggle_pause(const SequencerState &state, double now);

SequencerState toggle_loop(const SequencerState &state);

/**
 * @brief Drops the active sequence, keeping the pause and loop flags.
 */
SequencerState stop(const SequencerState &state);

/**
 * @brief Seconds spent in the active step, frozen while paused
 */
double elapsed(const SequencerState &state, double now) noexcept;

/**
 * @brief Pose for this tick: the active step's lifts and impulse, or a flat
 * bed with unit impulse when idle.
 */
StepOutput active_output(const SequencerState &state) noexcept;

} // namespace sequencer
