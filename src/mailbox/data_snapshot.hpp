#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

#include "../simulation/sequencer.hpp"

namespace mailbox {

/**
 * @brief Everything the presentation layer needs to draw one tick
 *
 * Read-only for consumers; the simulation publishes a fresh copy per tick.
 */
struct FrameSnapshot {
    /** @brief Interleaved pellet centres: x0, y0, x1, y1, ... */
    std::vector<float> positions;
    /** @brief Actuator heights applied this tick */
    Lifts lifts = {0.f, 0.f, 0.f};
    /** @brief Force multiplier applied this tick */
    float impulse = 1.f;
    /** @brief Force applied to every pellet this tick */
    Vector2 force = {0.f, 0.f};
    /** @brief "IDLE" or the active gesture's activity label */
    std::string label = "IDLE";
    SequencerPhase phase = SequencerPhase::Idle;
    bool paused = false;
    bool loop = true;
    int step_index = -1;
    int step_count = 0;
    long long tick = 0;

    inline int pellet_count() const noexcept {
        return (int)positions.size() / 2;
    }
};

/**
 * @brief Statistics snapshot containing simulation performance data
 */
struct SimulationStatsSnapshot {
    int effective_tps = 0;      // Effective ticks per second (averaged once
                                // per second)
    int pellets = 0;            // Current number of pellets in the world
    long long last_step_ns = 0; // Duration of last physics step
    long long published_ns = 0; // Timestamp when this snapshot was published
    long long num_steps = 0;    // Physics steps since the last world reset
};

/**
 * @brief Concept to constrain DataSnapshot to only accept valid snapshot types
 */
template <typename T>
concept ValidSnapshotType = std::is_same_v<T, FrameSnapshot> ||
                            std::is_same_v<T, SimulationStatsSnapshot>;

/**
 * @brief Double-buffered snapshot mailbox
 *
 * The writer fills the back buffer under a lock and flips the front index;
 * readers copy whichever buffer is currently in front without blocking the
 * writer.
 *
 * @tparam T The snapshot data type to buffer
 */
template <typename T>
    requires ValidSnapshotType<T>
class DataSnapshot {
  public:
    DataSnapshot() = default;
    ~DataSnapshot() = default;
    DataSnapshot(const DataSnapshot &) = delete;
    DataSnapshot(DataSnapshot &&) = delete;
    DataSnapshot &operator=(const DataSnapshot &) = delete;
    DataSnapshot &operator=(DataSnapshot &&) = delete;

    /**
     * @brief Publish a new snapshot
     * @param snapshot The snapshot data to publish
     */
    void publish(const T &snapshot) {
        std::lock_guard<std::mutex> lock(m_write_lock);
        int back = 1 - m_front.load(std::memory_order_relaxed);
        m_buffer[back] = snapshot;
        m_front.store(back, std::memory_order_release);
    }

    /**
     * @brief Acquire the current snapshot
     * @return The current snapshot data
     */
    T acquire() const {
        int f = m_front.load(std::memory_order_acquire);
        return m_buffer[f];
    }

  private:
    std::mutex m_write_lock;
    std::atomic<int> m_front{0};
    T m_buffer[2];
};

} // namespace mailbox
