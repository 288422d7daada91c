#include "tilt.hpp"

#include <cmath>

#include <raymath.h>

namespace tilt {

Vector3 plane_normal(const Lifts &lifts, const ActuatorLayout &layout) {
    Vector3 anchors[3];
    for (int i = 0; i < 3; ++i) {
        const float angle = layout.angles_deg[i] * DEG2RAD;
        const float height = std::isfinite(lifts[i]) ? lifts[i] : 0.f;
        anchors[i] = Vector3{layout.radius * std::cos(angle), height,
                             layout.radius * std::sin(angle)};
    }

    Vector3 normal =
        Vector3CrossProduct(Vector3Subtract(anchors[1], anchors[0]),
                            Vector3Subtract(anchors[2], anchors[0]));
    if (normal.y < 0.f) {
        normal = Vector3Negate(normal);
    }

    const float length = Vector3Length(normal);
    if (!std::isfinite(length) || length < DEGENERATE_EPS) {
        return Vector3{0.f, 1.f, 0.f};
    }

    return Vector3Scale(normal, 1.f / length);
}

Vector2 force_direction(Vector3 normal) noexcept {
    return Vector2{-normal.x, -normal.z};
}

Vector2 tilt_force(const Lifts &lifts, const ActuatorLayout &layout,
                   float force_factor) {
    return Vector2Scale(force_direction(plane_normal(lifts, layout)),
                        force_factor);
}

float plane_height_at(Vector3 normal, float x, float y) noexcept {
    if (std::fabs(normal.y) <= DEGENERATE_EPS) {
        return 0.f;
    }
    return -(normal.x * x + normal.z * y) / normal.y;
}

} // namespace tilt
