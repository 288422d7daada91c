#pragma once

#include <chrono>

namespace shakerbed {

/**
 * @brief Monotonic time source used by the sequencer
 *
 * Every step-timeout decision reads elapsed seconds through this interface so
 * that tests can drive logical time without sleeping.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /**
     * @brief Current monotonic time
     * @return Seconds since an arbitrary fixed epoch
     */
    virtual double now() const = 0;
};

/**
 * @brief Wall-clock source backed by std::chrono::steady_clock
 */
class SteadyClock : public Clock {
  public:
    SteadyClock() : m_epoch(std::chrono::steady_clock::now()) {}

    double now() const override {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                             m_epoch)
            .count();
    }

  private:
    std::chrono::steady_clock::time_point m_epoch;
};

/**
 * @brief Manually advanced clock for deterministic tests and replays
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(double start = 0.0) : m_now(start) {}

    double now() const override { return m_now; }

    /**
     * @brief Moves time forward
     * @param seconds Amount to advance; negative values are ignored
     */
    void advance(double seconds) {
        if (seconds > 0.0)
            m_now += seconds;
    }

    void set(double seconds) { m_now = seconds; }

  private:
    double m_now;
};

} // namespace shakerbed
