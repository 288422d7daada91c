#pragma once

#include <cstdint>
#include <random>

namespace shakerbed {

/**
 * @brief Seedable random source shared by pellet seeding and gesture
 * generation
 *
 * Wraps a std::mt19937 so the same seed always yields the same pellet layout
 * and the same sequence of actuator choices.
 */
class RandomSource {
  public:
    explicit RandomSource(std::uint32_t seed = std::random_device{}())
        : m_seed(seed), m_rng(seed) {}

    /**
     * @brief Restarts the stream from the given seed
     */
    void reseed(std::uint32_t seed) {
        m_seed = seed;
        m_rng.seed(seed);
    }

    std::uint32_t seed() const noexcept { return m_seed; }

    /** @brief Uniform float in [lo, hi) */
    float uniform(float lo, float hi) {
        std::uniform_real_distribution<float> dist(lo, hi);
        return dist(m_rng);
    }

    /** @brief Uniform integer in [lo, hi] */
    int uniform_int(int lo, int hi) {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(m_rng);
    }

    std::mt19937 &engine() noexcept { return m_rng; }

  private:
    std::uint32_t m_seed;
    std::mt19937 m_rng;
};

} // namespace shakerbed
