#pragma once

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include <raylib.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "bed_config.hpp"
#include "neighborindex.hpp"

/**
 * @brief One straight piece of the bed rim
 */
struct WallSegment {
    Vector2 a;
    Vector2 b;
};

/**
 * @brief 2D pellet world for one simulation epoch.
 *
 * Owns every pellet and the static rim. There is no ambient gravity: the tilt
 * of the bed reaches the pellets only through apply_force(), once per tick.
 * Pellet state is stored as structure-of-arrays; all pellets share the same
 * radius, mass, moment, damping and surface properties.
 */
class World {
  public:
    World() = default;
    ~World() = default;
    World(const World &) = delete;
    World(World &&) = delete;
    World &operator=(const World &) = delete;
    World &operator=(World &&) = delete;

    /**
     * @brief Discards the current epoch and builds a fresh rim and one pellet
     * per position.
     * @param positions Initial pellet centres
     * @param cfg Bed configuration providing the shared body parameters
     * @throws SimulationError if the body or rim parameters are unusable
     */
    void reset(const std::vector<Vector2> &positions, const BedConfig &cfg);

    /**
     * @brief Removes every pellet and wall.
     */
    void clear();

    /**
     * @brief Adds the same force to every pellet for the next step.
     * @param force Force vector before scaling
     * @param impulse Multiplier for the current animation step
     */
    void apply_force(Vector2 force, float impulse) noexcept;

    /**
     * @brief Advances the world by one fixed timestep.
     *
     * Accumulated forces are consumed and cleared. A non-positive dt leaves
     * the world untouched.
     *
     * @param dt Timestep in seconds
     */
    void step(float dt);

    /**
     * @brief Checks every pellet position and velocity for NaN/inf.
     */
    bool all_finite() const noexcept;

  public:
    inline int get_pellets_size() const noexcept { return (int)m_px.size(); }

    inline float get_px(int pellet_index) const noexcept {
        return m_px[pellet_index];
    }

    inline float get_py(int pellet_index) const noexcept {
        return m_py[pellet_index];
    }

    inline float get_vx(int pellet_index) const noexcept {
        return m_vx[pellet_index];
    }

    inline float get_vy(int pellet_index) const noexcept {
        return m_vy[pellet_index];
    }

    inline float get_w(int pellet_index) const noexcept {
        return m_w[pellet_index];
    }

    /** @brief Force accumulated since the last step */
    inline Vector2 get_force(int pellet_index) const noexcept {
        return Vector2{m_fx[pellet_index], m_fy[pellet_index]};
    }

    inline void set_velocity(int pellet_index, Vector2 v) noexcept {
        m_vx[pellet_index] = v.x;
        m_vy[pellet_index] = v.y;
    }

    inline const float *get_px_array() const noexcept { return m_px.data(); }
    inline const float *get_py_array() const noexcept { return m_py.data(); }

    inline const std::vector<WallSegment> &get_walls() const noexcept {
        return m_walls;
    }

    inline float get_bed_radius() const noexcept { return m_bed_radius; }
    inline float get_pellet_radius() const noexcept { return m_radius; }

    /**
     * @brief Largest distance from the bed centre a pellet centre may reach
     * without touching the rim.
     */
    inline float containment_radius() const noexcept {
        return m_containment_radius;
    }

  private:
    void integrate_velocities(float dt) noexcept;
    void collect_pairs(float margin);
    void solve_pellet_contacts() noexcept;
    void solve_wall_contacts() noexcept;
    void integrate_positions(float dt) noexcept;
    void correct_overlaps() noexcept;
    void contain() noexcept;
    void recover_non_finite();

  private:
    // shared body parameters
    float m_bed_radius = 0.f;
    float m_radius = 0.f;
    float m_inv_mass = 0.f;
    float m_inv_moment = 0.f;
    float m_elasticity = 0.f;
    float m_friction = 0.f;
    float m_linear_damping = 0.f;
    float m_angular_damping = 0.f;
    float m_wall_thickness = 0.f;
    float m_wall_elasticity = 0.f;
    float m_wall_friction = 0.f;
    float m_containment_radius = 0.f;
    int m_iterations = 1;

    std::vector<float> m_px; // Pellet X positions
    std::vector<float> m_py; // Pellet Y positions
    std::vector<float> m_vx; // Pellet X velocities
    std::vector<float> m_vy; // Pellet Y velocities
    std::vector<float> m_w;  // Pellet angular velocities
    std::vector<float> m_fx; // Accumulated X force
    std::vector<float> m_fy; // Accumulated Y force

    std::vector<WallSegment> m_walls;

    NeighborIndex m_idx;
    /** @brief Candidate contact pairs (i < j), rebuilt every step */
    std::vector<std::pair<int, int>> m_pairs;
};
