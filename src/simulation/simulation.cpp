#include "simulation.hpp"

#include <random>
#include <type_traits>
#include <variant>

#include <fmt/format.h>

using namespace std::chrono;

namespace {

std::uint32_t initial_seed(const BedConfig &cfg) {
    return cfg.fixed_seed ? cfg.rng_seed : std::random_device{}();
}

inline long long now_ns() {
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

Simulation::Simulation(const BedConfig &cfg, const shakerbed::Clock &clock)
    : m_cfg(cfg), m_layout{cfg.bed_radius, cfg.actuator_angles_deg},
      m_clock(clock), m_rng(initial_seed(cfg)) {
    validate_config(m_cfg);

    LOG_INFO(fmt::format("Initializing shaker bed: {} pellets, seed {}",
                         m_cfg.pellet_count, m_rng.seed()));

    m_seq.loop = m_cfg.loop_animation;
    rebuild_world(PileShape::Uniform);
    m_t_window_start = steady_clock::now();
    publish_frame();
}

void Simulation::push_command(const mailbox::command::Command &cmd) {
    m_mail_cmd.push(cmd);
}

void Simulation::select_gesture(Gesture gesture) {
    push_command(mailbox::command::SelectGesture{gesture});
}

void Simulation::toggle_pause() {
    push_command(mailbox::command::TogglePause{});
}

void Simulation::toggle_loop() { push_command(mailbox::command::ToggleLoop{}); }

void Simulation::reset() { push_command(mailbox::command::ResetWorld{}); }

void Simulation::quit() { push_command(mailbox::command::Quit{}); }

mailbox::FrameSnapshot Simulation::get_frame() const {
    return m_mail_frame.acquire();
}

mailbox::SimulationStatsSnapshot Simulation::get_stats() const {
    return m_mail_stats.acquire();
}

void Simulation::tick() {
    process_commands();
    if (m_run_state == RunState::Quit) {
        return;
    }

    if (m_seq.running && !m_seq.paused) {
        m_seq = sequencer::advance(m_seq, m_clock.now(), m_cfg, m_rng);
    }

    // idle resolves to a flat bed with unit impulse
    m_output = sequencer::active_output(m_seq);
    m_force = tilt::tilt_force(m_output.lifts, m_layout, m_cfg.force_factor);

    if (!m_seq.paused) {
        m_world.apply_force(m_force, m_output.impulse);

        const auto step_begin = steady_clock::now();
        m_world.step(m_cfg.dt());
        const auto step_end = steady_clock::now();

        m_total_steps++;
        m_t_window_steps++;
        measure_tps(step_end - step_begin);
    }

    m_ticks++;
    publish_frame();
}

void Simulation::process_commands() {
    for (const auto &cmd : m_mail_cmd.drain()) {
        if (m_run_state == RunState::Quit) {
            break;
        }
        std::visit(
            [&](auto &&c) {
                using T = std::decay_t<decltype(c)>;
                if constexpr (std::is_same_v<T,
                                             mailbox::command::SelectGesture>) {
                    handle_select_gesture(c);
                } else if constexpr (std::is_same_v<
                                         T, mailbox::command::ResetWorld>) {
                    handle_reset_world();
                } else if constexpr (std::is_same_v<
                                         T, mailbox::command::TogglePause>) {
                    handle_toggle_pause();
                } else if constexpr (std::is_same_v<
                                         T, mailbox::command::ToggleLoop>) {
                    handle_toggle_loop();
                } else if constexpr (std::is_same_v<T,
                                                    mailbox::command::Quit>) {
                    handle_quit();
                }
            },
            cmd);
    }
}

void Simulation::rebuild_world(PileShape pile) {
    m_pile = pile;
    m_world.reset(sample_pellets(m_cfg.pellet_count, pile, m_cfg, m_rng),
                  m_cfg);
    m_total_steps = 0;
    m_t_window_steps = 0;
    m_t_window_start = steady_clock::now();
}

void Simulation::publish_frame() {
    mailbox::FrameSnapshot frame;

    const int n = m_world.get_pellets_size();
    const float *const px_array = m_world.get_px_array();
    const float *const py_array = m_world.get_py_array();
    frame.positions.resize(size_t(n) * 2);
    for (int i = 0; i < n; ++i) {
        frame.positions[size_t(i) * 2 + 0] = px_array[i];
        frame.positions[size_t(i) * 2 + 1] = py_array[i];
    }

    frame.lifts = m_output.lifts;
    frame.impulse = m_output.impulse;
    frame.force = m_force;
    frame.phase = sequencer::phase(m_seq);
    frame.paused = m_seq.paused;
    frame.loop = m_seq.loop;
    frame.step_index = m_seq.step_index;
    if (m_seq.running && m_seq.sequence) {
        frame.label = std::string(gesture_activity(m_seq.sequence->gesture));
        frame.step_count = m_seq.sequence->size();
    }
    frame.tick = m_ticks;

    m_mail_frame.publish(frame);
}

void Simulation::measure_tps(nanoseconds step_diff_ns) noexcept {
    auto now = steady_clock::now();
    if (now - m_t_window_start >= 1s) {
        int secs = (int)duration_cast<seconds>(now - m_t_window_start).count();
        if (secs < 1)
            secs = 1;
        m_t_last_published_tps = m_t_window_steps / secs;
        m_t_window_steps = 0;
        m_t_window_start = now;
    }

    mailbox::SimulationStatsSnapshot st;
    st.effective_tps = m_t_last_published_tps;
    st.pellets = m_world.get_pellets_size();
    st.last_step_ns = step_diff_ns.count();
    st.published_ns = now_ns();
    st.num_steps = m_total_steps;
    m_mail_stats.publish(st);
}

void Simulation::handle_select_gesture(
    const mailbox::command::SelectGesture &cmd) {
    LOG_INFO(fmt::format("Gesture selected: {}", gesture_name(cmd.gesture)));

    rebuild_world(gesture_pile(cmd.gesture));
    m_seq = sequencer::stop(m_seq);
    m_seq = sequencer::start(gestures::make_sequence(cmd.gesture, m_cfg, m_rng),
                             m_clock.now(), m_seq.loop, m_seq.paused);
}

void Simulation::handle_reset_world() {
    LOG_INFO(fmt::format("Resetting world with a {} pile",
                         pile_shape_name(m_pile)));
    rebuild_world(m_pile);
    m_seq = sequencer::stop(m_seq);
}

void Simulation::handle_toggle_pause() {
    m_seq = sequencer::toggle_pause(m_seq, m_clock.now());
    LOG_INFO(m_seq.paused ? "Paused" : "Resumed");
}

void Simulation::handle_toggle_loop() {
    m_seq = sequencer::toggle_loop(m_seq);
    LOG_INFO(fmt::format("Looping {}", m_seq.loop ? "enabled" : "disabled"));
}

void Simulation::handle_quit() { m_run_state = RunState::Quit; }
