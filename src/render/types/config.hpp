#pragma once

#include <raylib.h>

struct CameraState {
    float yaw_deg = 0.0f; // orbit around the vertical axis
    float zoom = 1.0f;    // eye distance multiplier

    static constexpr Vector3 BASE_EYE = {0.0f, 30.0f, 25.0f};
};

struct Config {
    // ui
    bool show_ui = true;
    bool show_hud = true;

    // scene
    bool show_shadow = true;
    bool show_actuators = true;
    float rim_height = 0.5f;
    int pellet_rings = 8;
    int pellet_slices = 8;
    Vector3 light_position = {0.0f, 20.0f, 0.0f};

    // colors
    Color background_color = {20, 20, 24, 255};
    Color floor_color = {153, 153, 153, 255};
    Color wall_color = {128, 128, 128, 255};
    Color bed_color = {128, 128, 140, 255};
    Color rim_color = {204, 204, 204, 255};
    Color pellet_color = {51, 153, 204, 255};
    Color shadow_color = {26, 26, 26, 128};
    Color actuator_idle_color = {90, 90, 100, 255};
    Color actuator_lift_color = {230, 90, 60, 255};

    // camera
    CameraState camera;
};
