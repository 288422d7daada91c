#include "world.hpp"

#include <fmt/format.h>

namespace {

constexpr float EPS = 1e-6f;
/** @brief Overlap tolerated before positions are corrected */
constexpr float SLOP_FRACTION = 0.05f;
/** @brief Share of the remaining overlap removed per step */
constexpr float CORRECTION = 0.8f;

inline float cross2(float ax, float ay, float bx, float by) {
    return ax * by - ay * bx;
}

inline Vector2 closest_on_segment(const WallSegment &s, float x, float y) {
    const float ex = s.b.x - s.a.x;
    const float ey = s.b.y - s.a.y;
    const float len2 = ex * ex + ey * ey;
    float t = 0.f;
    if (len2 > EPS) {
        t = std::clamp(((x - s.a.x) * ex + (y - s.a.y) * ey) / len2, 0.f, 1.f);
    }
    return Vector2{s.a.x + ex * t, s.a.y + ey * t};
}

} // namespace

void World::reset(const std::vector<Vector2> &positions, const BedConfig &cfg) {
    if (cfg.pellet_radius <= 0.f || cfg.pellet_mass <= 0.f ||
        cfg.pellet_moment <= 0.f) {
        throw shakerbed::SimulationError(fmt::format(
            "Invalid pellet body: radius={} mass={} moment={}",
            cfg.pellet_radius, cfg.pellet_mass, cfg.pellet_moment));
    }
    if (cfg.bed_radius <= 0.f || cfg.wall_segments < 3) {
        throw shakerbed::SimulationError(
            fmt::format("Invalid bed rim: radius={} segments={}",
                        cfg.bed_radius, cfg.wall_segments));
    }

    clear();

    m_bed_radius = cfg.bed_radius;
    m_radius = cfg.pellet_radius;
    m_inv_mass = 1.f / cfg.pellet_mass;
    m_inv_moment = 1.f / cfg.pellet_moment;
    m_elasticity = cfg.pellet_elasticity;
    m_friction = cfg.pellet_friction;
    m_linear_damping = cfg.linear_damping;
    m_angular_damping = cfg.angular_damping;
    m_wall_thickness = cfg.wall_thickness;
    m_wall_elasticity = cfg.wall_elasticity;
    m_wall_friction = cfg.wall_friction;
    m_iterations = std::max(1, cfg.solver_iterations);

    // the polygon's inscribed circle is R cos(pi/N)
    const float inscribed =
        cfg.bed_radius * std::cos(PI / float(cfg.wall_segments));
    m_containment_radius =
        std::max(0.f, inscribed - cfg.wall_thickness - cfg.pellet_radius);

    m_walls.reserve(cfg.wall_segments);
    for (int i = 0; i < cfg.wall_segments; ++i) {
        const float a0 = 2.f * PI * float(i) / float(cfg.wall_segments);
        const float a1 = 2.f * PI * float(i + 1) / float(cfg.wall_segments);
        m_walls.push_back(WallSegment{
            {cfg.bed_radius * std::cos(a0), cfg.bed_radius * std::sin(a0)},
            {cfg.bed_radius * std::cos(a1), cfg.bed_radius * std::sin(a1)}});
    }

    const size_t n = positions.size();
    m_px.resize(n);
    m_py.resize(n);
    m_vx.assign(n, 0.f);
    m_vy.assign(n, 0.f);
    m_w.assign(n, 0.f);
    m_fx.assign(n, 0.f);
    m_fy.assign(n, 0.f);
    for (size_t i = 0; i < n; ++i) {
        m_px[i] = positions[i].x;
        m_py[i] = positions[i].y;
    }

    LOG_DEBUG(fmt::format("World reset: {} pellets, {} wall segments", n,
                          m_walls.size()));
}

void World::clear() {
    m_px.clear();
    m_py.clear();
    m_vx.clear();
    m_vy.clear();
    m_w.clear();
    m_fx.clear();
    m_fy.clear();
    m_walls.clear();
    m_pairs.clear();
    m_idx.lastN = -1;
}

void World::apply_force(Vector2 force, float impulse) noexcept {
    const float fx = force.x * impulse;
    const float fy = force.y * impulse;
    const int n = get_pellets_size();
    for (int i = 0; i < n; ++i) {
        m_fx[i] += fx;
        m_fy[i] += fy;
    }
}

void World::step(float dt) {
    if (!(dt > 0.f) || get_pellets_size() == 0) {
        return;
    }

    integrate_velocities(dt);

    collect_pairs(m_radius * 0.5f);
    for (int it = 0; it < m_iterations; ++it) {
        solve_pellet_contacts();
        solve_wall_contacts();
    }

    integrate_positions(dt);

    collect_pairs(0.f);
    correct_overlaps();
    contain();
    recover_non_finite();
}

bool World::all_finite() const noexcept {
    const int n = get_pellets_size();
    for (int i = 0; i < n; ++i) {
        if (!std::isfinite(m_px[i]) || !std::isfinite(m_py[i]) ||
            !std::isfinite(m_vx[i]) || !std::isfinite(m_vy[i]) ||
            !std::isfinite(m_w[i])) {
            return false;
        }
    }
    return true;
}

void World::integrate_velocities(float dt) noexcept {
    const float linear_keep = 1.f / (1.f + m_linear_damping * dt);
    const float angular_keep = 1.f / (1.f + m_angular_damping * dt);
    const int n = get_pellets_size();

    for (int i = 0; i < n; ++i) {
        m_vx[i] = (m_vx[i] + m_fx[i] * m_inv_mass * dt) * linear_keep;
        m_vy[i] = (m_vy[i] + m_fy[i] * m_inv_mass * dt) * linear_keep;
        m_w[i] *= angular_keep;
        m_fx[i] = 0.f;
        m_fy[i] = 0.f;
    }
}

void World::collect_pairs(float margin) {
    const int n = get_pellets_size();
    const float reach = 2.f * m_radius + margin;
    const float reach2 = reach * reach;

    m_idx.ensure(m_px.data(), m_py.data(), n, m_bed_radius,
                 2.f * m_radius + m_radius * 0.5f);
    m_pairs.clear();

    for (int i = 0; i < n; ++i) {
        const float x = m_px[i];
        const float y = m_py[i];
        m_idx.grid.for_each_neighbor(x, y, [&](int j) {
            if (j <= i) {
                return;
            }
            const float dx = m_px[j] - x;
            const float dy = m_py[j] - y;
            if (dx * dx + dy * dy < reach2) {
                m_pairs.emplace_back(i, j);
            }
        });
    }
}

void World::solve_pellet_contacts() noexcept {
    const float r = m_radius;
    const float e = m_elasticity * m_elasticity;
    const float mu = m_friction * m_friction;
    const float k_normal = 2.f * m_inv_mass;
    const float k_tangent = 2.f * m_inv_mass + 2.f * r * r * m_inv_moment;
    const float contact2 = 4.f * r * r;

    for (const auto &[i, j] : m_pairs) {
        const float dx = m_px[j] - m_px[i];
        const float dy = m_py[j] - m_py[i];
        const float d2 = dx * dx + dy * dy;
        if (d2 >= contact2) {
            continue;
        }

        float nx = 1.f, ny = 0.f;
        if (d2 > EPS * EPS) {
            const float d = std::sqrt(d2);
            nx = dx / d;
            ny = dy / d;
        }

        // contact-point velocities, arms are +r*n for i and -r*n for j
        const float vix = m_vx[i] - m_w[i] * r * ny;
        const float viy = m_vy[i] + m_w[i] * r * nx;
        const float vjx = m_vx[j] + m_w[j] * r * ny;
        const float vjy = m_vy[j] - m_w[j] * r * nx;
        const float rvx = vjx - vix;
        const float rvy = vjy - viy;

        const float vn = rvx * nx + rvy * ny;
        if (vn >= 0.f) {
            continue;
        }

        const float jn = -(1.f + e) * vn / k_normal;
        m_vx[i] -= jn * nx * m_inv_mass;
        m_vy[i] -= jn * ny * m_inv_mass;
        m_vx[j] += jn * nx * m_inv_mass;
        m_vy[j] += jn * ny * m_inv_mass;

        const float tx = -ny;
        const float ty = nx;
        const float vt = rvx * tx + rvy * ty;
        const float jt = std::clamp(-vt / k_tangent, -mu * jn, mu * jn);
        m_vx[i] -= jt * tx * m_inv_mass;
        m_vy[i] -= jt * ty * m_inv_mass;
        m_vx[j] += jt * tx * m_inv_mass;
        m_vy[j] += jt * ty * m_inv_mass;
        m_w[i] -= jt * r * m_inv_moment;
        m_w[j] -= jt * r * m_inv_moment;
    }
}

void World::solve_wall_contacts() noexcept {
    const float r = m_radius;
    const float reach = r + m_wall_thickness;
    const float reach2 = reach * reach;
    // pellets closer to the centre than this cannot touch any segment
    const float near_rim = m_containment_radius - 0.5f * r;
    const float near_rim2 = near_rim * near_rim;
    const float e = m_elasticity * m_wall_elasticity;
    const float mu = m_friction * m_wall_friction;
    const float k_tangent = m_inv_mass + r * r * m_inv_moment;
    const int n = get_pellets_size();

    for (int i = 0; i < n; ++i) {
        const float x = m_px[i];
        const float y = m_py[i];
        if (x * x + y * y < near_rim2) {
            continue;
        }

        for (const WallSegment &wall : m_walls) {
            const Vector2 c = closest_on_segment(wall, x, y);
            const float dx = x - c.x;
            const float dy = y - c.y;
            const float d2 = dx * dx + dy * dy;
            if (d2 >= reach2) {
                continue;
            }

            // normal points from the wall into the bed
            float nx, ny;
            if (d2 > EPS * EPS) {
                const float d = std::sqrt(d2);
                nx = dx / d;
                ny = dy / d;
            } else {
                const float len = std::sqrt(x * x + y * y);
                nx = (len > EPS) ? -x / len : 1.f;
                ny = (len > EPS) ? -y / len : 0.f;
            }

            // contact arm is -r*n
            const float vcx = m_vx[i] + m_w[i] * r * ny;
            const float vcy = m_vy[i] - m_w[i] * r * nx;
            const float vn = vcx * nx + vcy * ny;
            if (vn >= 0.f) {
                continue;
            }

            const float jn = -(1.f + e) * vn / m_inv_mass;
            m_vx[i] += jn * nx * m_inv_mass;
            m_vy[i] += jn * ny * m_inv_mass;

            const float tx = -ny;
            const float ty = nx;
            const float vt = vcx * tx + vcy * ty;
            const float jt = std::clamp(-vt / k_tangent, -mu * jn, mu * jn);
            m_vx[i] += jt * tx * m_inv_mass;
            m_vy[i] += jt * ty * m_inv_mass;
            m_w[i] += cross2(-r * nx, -r * ny, jt * tx, jt * ty) * m_inv_moment;
        }
    }
}

void World::integrate_positions(float dt) noexcept {
    const int n = get_pellets_size();
    for (int i = 0; i < n; ++i) {
        m_px[i] += m_vx[i] * dt;
        m_py[i] += m_vy[i] * dt;
    }
}

void World::correct_overlaps() noexcept {
    const float contact = 2.f * m_radius;
    const float slop = SLOP_FRACTION * m_radius;

    for (const auto &[i, j] : m_pairs) {
        const float dx = m_px[j] - m_px[i];
        const float dy = m_py[j] - m_py[i];
        const float d2 = dx * dx + dy * dy;
        if (d2 >= contact * contact) {
            continue;
        }

        const float d = std::sqrt(d2);
        const float overlap = contact - d;
        if (overlap <= slop) {
            continue;
        }

        float nx = 1.f, ny = 0.f;
        if (d > EPS) {
            nx = dx / d;
            ny = dy / d;
        }
        const float push = 0.5f * CORRECTION * (overlap - slop);
        m_px[i] -= nx * push;
        m_py[i] -= ny * push;
        m_px[j] += nx * push;
        m_py[j] += ny * push;
    }
}

void World::contain() noexcept {
    const float limit = m_containment_radius;
    const int n = get_pellets_size();

    for (int i = 0; i < n; ++i) {
        const float d2 = m_px[i] * m_px[i] + m_py[i] * m_py[i];
        if (d2 <= limit * limit) {
            continue;
        }

        const float d = std::sqrt(d2);
        const float nx = m_px[i] / d;
        const float ny = m_py[i] / d;
        m_px[i] = nx * limit;
        m_py[i] = ny * limit;

        // drop the outward part of the velocity
        const float outward = m_vx[i] * nx + m_vy[i] * ny;
        if (outward > 0.f) {
            m_vx[i] -= outward * nx;
            m_vy[i] -= outward * ny;
        }
    }
}

void World::recover_non_finite() {
    const int n = get_pellets_size();
    for (int i = 0; i < n; ++i) {
        if (std::isfinite(m_px[i]) && std::isfinite(m_py[i]) &&
            std::isfinite(m_vx[i]) && std::isfinite(m_vy[i]) &&
            std::isfinite(m_w[i])) {
            continue;
        }

        LOG_WARN(fmt::format("Pellet {} left the finite range, recentring", i));
        m_px[i] = 0.f;
        m_py[i] = 0.f;
        m_vx[i] = 0.f;
        m_vy[i] = 0.f;
        m_w[i] = 0.f;
    }
}
