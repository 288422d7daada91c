#pragma once

#include <array>

#include <raylib.h>

/**
 * @brief Heights of the three actuators, in bed units, ordered as the
 * actuator layout
 */
using Lifts = std::array<float, 3>;

/**
 * @brief Fixed positions of the actuators on the bed rim
 */
struct ActuatorLayout {
    /** @brief Rim radius the actuators sit on */
    float radius;
    /** @brief Angular positions in degrees */
    std::array<float, 3> angles_deg;
};

namespace tilt {

/** @brief Normals shorter than this are treated as degenerate */
constexpr float DEGENERATE_EPS = 1e-6f;

/**
 * @brief Unit normal of the plane through the three actuator anchors
 *
 * Anchor i sits at (R cos θi, hi, R sin θi). The normal always points up
 * (y >= 0); degenerate layouts return (0, 1, 0). Non-finite heights are read
 * as 0.
 *
 * @param lifts Actuator heights
 * @param layout Actuator positions
 * @return Unit normal, never NaN
 */
Vector3 plane_normal(const Lifts &lifts, const ActuatorLayout &layout);

/**
 * @brief Downhill direction on the bed floor for a plane normal
 * @return (-n.x, -n.z)
 */
Vector2 force_direction(Vector3 normal) noexcept;

/**
 * @brief Force applied to every pellet for the given lifts, before the step
 * impulse multiplier
 * @param lifts Actuator heights
 * @param layout Actuator positions
 * @param force_factor Global force scale
 */
Vector2 tilt_force(const Lifts &lifts, const ActuatorLayout &layout,
                   float force_factor);

/**
 * @brief Height of the tilted plane above the bed centre at floor point (x, y)
 *
 * Floor coordinates map to world (x, z). Returns 0 for a vertical plane.
 */
float plane_height_at(Vector3 normal, float x, float y) noexcept;

} // namespace tilt
