#include "bed_renderer.hpp"

#include <cmath>

#include <raymath.h>
#include <rlgl.h>

#include "../simulation/tilt.hpp"

namespace {

constexpr float ROOM_HALF = 30.0f;
constexpr float BED_THICKNESS = 0.02f;
constexpr float SHADOW_LIFT = 0.01f;

// Rotation taking the world up axis onto the bed normal.
bool bed_rotation(Vector3 normal, Vector3 &axis, float &angle_rad) {
    const Vector3 up = {0.0f, 1.0f, 0.0f};
    axis = Vector3CrossProduct(up, normal);
    const float len = Vector3Length(axis);
    if (len <= tilt::DEGENERATE_EPS) {
        return false;
    }
    axis = Vector3Scale(axis, 1.0f / len);
    angle_rad = std::acos(Clamp(Vector3DotProduct(up, normal), -1.0f, 1.0f));
    return true;
}

Vector3 on_bed(Vector3 local, Vector3 normal) {
    Vector3 axis;
    float angle;
    if (!bed_rotation(normal, axis, angle)) {
        return local;
    }
    return Vector3RotateByAxisAngle(local, axis, angle);
}

} // namespace

Camera3D BedRenderer::make_camera(const CameraState &state) {
    const float yaw = state.yaw_deg * DEG2RAD;
    const Vector3 base = CameraState::BASE_EYE;

    Camera3D cam{};
    cam.position = {base.z * std::sin(yaw) * state.zoom, base.y * state.zoom,
                    base.z * std::cos(yaw) * state.zoom};
    cam.target = {0.0f, 0.0f, 0.0f};
    cam.up = {0.0f, 1.0f, 0.0f};
    cam.fovy = 45.0f;
    cam.projection = CAMERA_PERSPECTIVE;
    return cam;
}

void BedRenderer::render(Context &ctx) {
    const Config &rcfg = ctx.rcfg;
    const BedConfig &cfg = ctx.sim.get_config();
    const ActuatorLayout &layout = ctx.sim.get_layout();
    const Vector3 normal = tilt::plane_normal(ctx.frame.lifts, layout);

    BeginMode3D(make_camera(rcfg.camera));
    {
        draw_environment(rcfg);
        if (rcfg.show_shadow) {
            draw_shadow(rcfg, normal, cfg.bed_radius, cfg.wall_segments);
        }
        draw_bed(rcfg, normal, cfg.bed_radius, cfg.wall_segments);
        if (rcfg.show_actuators) {
            draw_actuators(rcfg, layout, ctx.frame.lifts, normal);
        }
        draw_pellets(rcfg, ctx.frame, normal, cfg.pellet_radius);
    }
    EndMode3D();

    if (rcfg.show_hud) {
        draw_hud(ctx);
    }
}

void BedRenderer::draw_environment(const Config &rcfg) const {
    DrawPlane({0.0f, 0.0f, 0.0f}, {ROOM_HALF * 2.0f, ROOM_HALF * 2.0f},
              rcfg.floor_color);
    DrawCube({0.0f, ROOM_HALF * 0.5f, -ROOM_HALF}, ROOM_HALF * 2.0f, ROOM_HALF,
             0.1f, rcfg.wall_color);
}

void BedRenderer::draw_bed(const Config &rcfg, Vector3 normal, float radius,
                           int segments) const {
    Vector3 axis;
    float angle;

    rlPushMatrix();
    if (bed_rotation(normal, axis, angle)) {
        rlRotatef(angle * RAD2DEG, axis.x, axis.y, axis.z);
    }

    DrawCylinder({0.0f, 0.0f, 0.0f}, radius, radius, BED_THICKNESS, segments,
                 rcfg.bed_color);

    // rim band, visible from both sides
    rlDisableBackfaceCulling();
    const float step = 2.0f * PI / (float)segments;
    for (int i = 0; i < segments; ++i) {
        const float a0 = step * (float)i;
        const float a1 = step * (float)(i + 1);
        const Vector3 b0 = {radius * std::cos(a0), 0.0f, radius * std::sin(a0)};
        const Vector3 b1 = {radius * std::cos(a1), 0.0f, radius * std::sin(a1)};
        const Vector3 t0 = {b0.x, rcfg.rim_height, b0.z};
        const Vector3 t1 = {b1.x, rcfg.rim_height, b1.z};
        DrawTriangle3D(b0, t0, t1, rcfg.rim_color);
        DrawTriangle3D(b0, t1, b1, rcfg.rim_color);
    }
    rlEnableBackfaceCulling();

    rlPopMatrix();
}

void BedRenderer::draw_shadow(const Config &rcfg, Vector3 normal, float radius,
                              int segments) const {
    const Vector3 light = rcfg.light_position;

    // central projection of a bed point onto the floor
    auto project = [&](Vector3 p) {
        const float denom = light.y - p.y;
        if (std::fabs(denom) <= tilt::DEGENERATE_EPS) {
            return Vector3{p.x, SHADOW_LIFT, p.z};
        }
        const float t = (light.y - SHADOW_LIFT) / denom;
        return Vector3{light.x + (p.x - light.x) * t, SHADOW_LIFT,
                       light.z + (p.z - light.z) * t};
    };

    const Vector3 centre = project(on_bed({0.0f, 0.0f, 0.0f}, normal));
    const float step = 2.0f * PI / (float)segments;

    rlDisableBackfaceCulling();
    for (int i = 0; i < segments; ++i) {
        const float a0 = step * (float)i;
        const float a1 = step * (float)(i + 1);
        const Vector3 p0 = project(on_bed(
            {radius * std::cos(a0), 0.0f, radius * std::sin(a0)}, normal));
        const Vector3 p1 = project(on_bed(
            {radius * std::cos(a1), 0.0f, radius * std::sin(a1)}, normal));
        DrawTriangle3D(centre, p0, p1, rcfg.shadow_color);
    }
    rlEnableBackfaceCulling();
}

void BedRenderer::draw_actuators(const Config &rcfg,
                                 const ActuatorLayout &layout,
                                 const Lifts &lifts, Vector3 normal) const {
    for (size_t i = 0; i < layout.angles_deg.size(); ++i) {
        const float a = layout.angles_deg[i] * DEG2RAD;
        const float x = layout.radius * std::cos(a);
        const float z = layout.radius * std::sin(a);
        const float h = tilt::plane_height_at(normal, x, z);
        const Color c =
            lifts[i] > 0.0f ? rcfg.actuator_lift_color : rcfg.actuator_idle_color;
        DrawCube({x, h + rcfg.rim_height * 0.5f, z}, 0.4f, rcfg.rim_height,
                 0.4f, c);
    }
}

void BedRenderer::draw_pellets(const Config &rcfg,
                               const mailbox::FrameSnapshot &frame,
                               Vector3 normal, float pellet_radius) const {
    const int n = frame.pellet_count();
    for (int i = 0; i < n; ++i) {
        const float x = frame.positions[size_t(i) * 2 + 0];
        const float y = frame.positions[size_t(i) * 2 + 1];
        const float h = tilt::plane_height_at(normal, x, y);
        DrawSphereEx({x, h + pellet_radius, y}, pellet_radius,
                     rcfg.pellet_rings, rcfg.pellet_slices, rcfg.pellet_color);
    }
}

void BedRenderer::draw_hud(const Context &ctx) const {
    const auto &frame = ctx.frame;
    const Color text = {220, 220, 225, 255};
    int y = 12;

    DrawText(TextFormat("Mode: %s%s", frame.label.c_str(),
                        frame.paused ? " (PAUSED)" : ""),
             12, y, 20, text);
    y += 22;
    if (frame.step_count > 0) {
        DrawText(TextFormat("step %d / %d", frame.step_index + 1,
                            frame.step_count),
                 12, y, 20, text);
        y += 22;
    }
    DrawText(TextFormat("lifts %.2f %.2f %.2f  impulse %.1f", frame.lifts[0],
                        frame.lifts[1], frame.lifts[2], frame.impulse),
             12, y, 20, text);
    y += 22;
    DrawText(TextFormat("loop=%s  tps=%d  pellets=%d",
                        frame.loop ? "on" : "off", ctx.stats.effective_tps,
                        frame.pellet_count()),
             12, y, 20, text);

    DrawText("1 flatten | 2 scramble | 3 dump | Space pause | L loop | "
             "R reset | U ui | Esc quit",
             12, ctx.wcfg.screen_height - 28, 18, text);
}
