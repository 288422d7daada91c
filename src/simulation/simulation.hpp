#pragma once

#include <chrono>
#include <vector>

#include <raylib.h>

#include "../mailbox/command/queue.hpp"
#include "../mailbox/data_snapshot.hpp"
#include "../utility/clock.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "../utility/random.hpp"
#include "bed_config.hpp"
#include "seeder.hpp"
#include "sequence.hpp"
#include "sequencer.hpp"
#include "tilt.hpp"
#include "world.hpp"

/**
 * @brief Drives the shaker bed: commands, actuator sequencing, tilt force and
 * physics, one tick at a time.
 *
 * Everything runs on the caller's thread. Commands pushed between ticks are
 * applied at the top of the next tick(); the frame snapshot published at the
 * end of each tick is the only thing the renderer reads.
 */
class Simulation {
  public:
    /**
     * @brief Simulation execution states
     */
    enum class RunState { Running, Quit };

  public:
    /**
     * @brief Builds the controller with a uniform pile and an idle sequencer
     * @param cfg Bed configuration, validated here
     * @param clock Time source for step timing; must outlive the simulation
     * @throws shakerbed::ConfigError if cfg is invalid
     */
    Simulation(const BedConfig &cfg, const shakerbed::Clock &clock);
    ~Simulation() = default;
    Simulation(const Simulation &) = delete;
    Simulation &operator=(const Simulation &) = delete;
    Simulation(Simulation &&) = delete;
    Simulation &operator=(Simulation &&) = delete;

    /**
     * @brief Queues a command for the next tick
     * @param cmd Command to execute
     */
    void push_command(const mailbox::command::Command &cmd);

    void select_gesture(Gesture gesture);
    void toggle_pause();
    void toggle_loop();
    void reset();
    void quit();

    /**
     * @brief Runs one tick: drain commands, advance the sequencer, compute
     * the tilt force, apply it, step the world and publish the frame.
     *
     * While paused neither the sequencer nor the world moves. After Quit the
     * call does nothing.
     */
    void tick();

    /**
     * @brief Latest published frame
     */
    mailbox::FrameSnapshot get_frame() const;

    /**
     * @brief Latest published statistics
     */
    mailbox::SimulationStatsSnapshot get_stats() const;

    inline RunState get_run_state() const noexcept { return m_run_state; }

    inline const SequencerState &get_sequencer_state() const noexcept {
        return m_seq;
    }

    inline const World &get_world() const noexcept { return m_world; }

    inline const BedConfig &get_config() const noexcept { return m_cfg; }

    inline const ActuatorLayout &get_layout() const noexcept {
        return m_layout;
    }

    /** @brief Pose applied on the last tick */
    inline const StepOutput &get_output() const noexcept { return m_output; }

    /** @brief Force (before impulse) applied on the last tick */
    inline Vector2 get_force() const noexcept { return m_force; }

    inline PileShape get_pile() const noexcept { return m_pile; }

    inline long long get_total_ticks() const noexcept { return m_ticks; }

  private:
    void process_commands();
    void rebuild_world(PileShape pile);
    void publish_frame();
    void measure_tps(std::chrono::nanoseconds step_diff_ns) noexcept;

    void handle_select_gesture(const mailbox::command::SelectGesture &cmd);
    void handle_reset_world();
    void handle_toggle_pause();
    void handle_toggle_loop();
    void handle_quit();

  private:
    BedConfig m_cfg;
    ActuatorLayout m_layout;
    const shakerbed::Clock &m_clock;
    shakerbed::RandomSource m_rng;

    World m_world;
    PileShape m_pile{PileShape::Uniform};
    SequencerState m_seq;
    StepOutput m_output;
    Vector2 m_force{0.f, 0.f};

    mailbox::command::Queue m_mail_cmd;
    mailbox::DataSnapshot<mailbox::FrameSnapshot> m_mail_frame;
    mailbox::DataSnapshot<mailbox::SimulationStatsSnapshot> m_mail_stats;

    RunState m_run_state{RunState::Running};
    long long m_ticks{0};
    long long m_total_steps{0};
    int m_t_window_steps{0};
    int m_t_last_published_tps{0};
    std::chrono::steady_clock::time_point m_t_window_start;
};
