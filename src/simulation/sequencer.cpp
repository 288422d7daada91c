#include "sequencer.hpp"

#include <fmt/format.h>

#include "../utility/logger.hpp"

namespace {

bool can_rearm(const AnimationSequence &seq, bool loop) noexcept {
    return loop && seq.policy == LoopPolicy::Repeat &&
           seq.gesture != Gesture::Flatten;
}

} // namespace

const AnimationStep *SequencerState::current_step() const noexcept {
    if (!running || !sequence || step_index < 0 ||
        step_index >= sequence->size()) {
        return nullptr;
    }
    return &sequence->steps[step_index];
}

namespace sequencer {

SequencerPhase phase(const SequencerState &state) noexcept {
    if (!state.running) {
        return SequencerPhase::Idle;
    }
    return state.paused ? SequencerPhase::Paused : SequencerPhase::Running;
}

SequencerState start(SequencePtr sequence, double now, bool loop,
                     bool paused) {
    SequencerState out;
    out.loop = loop;
    out.paused = paused;

    if (!sequence || sequence->empty()) {
        LOG_WARN("Refusing to start an empty sequence");
        return out;
    }

    out.sequence = std::move(sequence);
    out.step_index = 0;
    out.step_start = now;
    out.running = true;
    return out;
}

SequencerState advance(const SequencerState &state, double now,
                       const BedConfig &cfg, shakerbed::RandomSource &rng) {
    if (!state.running || state.paused) {
        return state;
    }
    if (!state.sequence || state.sequence->empty()) {
        return stop(state);
    }

    SequencerState out = state;
    const AnimationSequence &seq = *state.sequence;

    if (state.step_index < 0) {
        out.step_index = 0;
        out.step_start = now;
        return out;
    }

    if (state.step_index < seq.size()) {
        const AnimationStep &step = seq.steps[state.step_index];
        if (now - state.step_start <= double(step.duration)) {
            return out;
        }
    }

    const int next = state.step_index + 1;
    if (next < seq.size()) {
        out.step_index = next;
        out.step_start = now;
        return out;
    }

    if (can_rearm(seq, state.loop)) {
        SequencePtr replay = state.sequence;
        if (seq.regenerate_on_loop) {
            replay = gestures::make_sequence(seq.gesture, cfg, rng);
        }
        if (replay && !replay->empty()) {
            LOG_DEBUG(fmt::format("{} sequence re-armed",
                                  gesture_name(replay->gesture)));
            out.sequence = std::move(replay);
            out.step_index = 0;
            out.step_start = now;
            return out;
        }
    }

    LOG_INFO(fmt::format("{} sequence finished, going idle",
                         gesture_name(seq.gesture)));
    return stop(state);
}

SequencerState toggle_pause(const SequencerState &state, double now) {
    SequencerState out = state;
    if (!state.paused) {
        out.paused = true;
        out.paused_elapsed = state.running ? now - state.step_start : 0.0;
    } else {
        out.paused = false;
        if (state.running) {
            out.step_start = now - state.paused_elapsed;
        }
        out.paused_elapsed = 0.0;
    }
    return out;
}

SequencerState toggle_loop(const SequencerState &state) {
    SequencerState out = state;
    out.loop = !state.loop;
    return out;
}

SequencerState stop(const SequencerState &state) {
    SequencerState out;
    out.paused = state.paused;
    out.loop = state.loop;
    return out;
}

double elapsed(const SequencerState &state, double now) noexcept {
    if (!state.running) {
        return 0.0;
    }
    return state.paused ? state.paused_elapsed : now - state.step_start;
}

StepOutput active_output(const SequencerState &state) noexcept {
    const AnimationStep *step = state.current_step();
    if (!step) {
        return StepOutput{};
    }
    return StepOutput{step->lifts, step->impulse};
}

} // namespace sequencer
