#include "keys.hpp"

#include <algorithm>

#include "mailbox/command/cmds.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

void setup_keys(KeyManager &key_manager, Simulation &sim, Config &rcfg,
                ConfigManager &config_manager, bool &should_exit) {
    key_manager.on_key_pressed(KEY_ESCAPE, [&should_exit, &sim]() {
        sim.push_command(mailbox::command::Quit{});
        should_exit = true;
    }); // Esc

    // Gestures
    key_manager.on_key_pressed(KEY_ONE, [&sim]() {
        sim.push_command(mailbox::command::SelectGesture{Gesture::Flatten});
    }); // 1

    key_manager.on_key_pressed(KEY_TWO, [&sim]() {
        sim.push_command(mailbox::command::SelectGesture{Gesture::Scramble});
    }); // 2

    key_manager.on_key_pressed(KEY_THREE, [&sim]() {
        sim.push_command(mailbox::command::SelectGesture{Gesture::Dump});
    }); // 3

    // Simulation controls
    key_manager.on_key_pressed(KEY_SPACE, [&sim]() {
        sim.push_command(mailbox::command::TogglePause{});
    }); // Space

    key_manager.on_key_pressed(KEY_L, [&sim]() {
        sim.push_command(mailbox::command::ToggleLoop{});
    }); // L

    key_manager.on_key_pressed(KEY_R, [&sim]() {
        sim.push_command(mailbox::command::ResetWorld{});
    }); // R

    // Configuration
    key_manager.on_key_pressed(
        KEY_S,
        [&sim, &config_manager]() {
            try {
                config_manager.save_config(ConfigManager::DEFAULT_CONFIG_FILE,
                                           sim.get_config());
            } catch (const shakerbed::IOError &e) {
                LOG_ERROR("Failed to save configuration: " +
                          std::string(e.what()));
            }
        },
        true); // Ctrl+S

    // UI toggles
    key_manager.on_key_pressed(KEY_U, [&rcfg]() {
        rcfg.show_ui = !rcfg.show_ui;
    }); // U

    key_manager.on_key_pressed(KEY_H, [&rcfg]() {
        rcfg.show_hud = !rcfg.show_hud;
    }); // H

    // Camera orbit
    static const float orbit_speed = 1.5f;
    key_manager.on_key_down(KEY_LEFT, [&rcfg]() {
        rcfg.camera.yaw_deg -= orbit_speed;
        if (rcfg.camera.yaw_deg < -180.0f)
            rcfg.camera.yaw_deg += 360.0f;
    }); // Left arrow

    key_manager.on_key_down(KEY_RIGHT, [&rcfg]() {
        rcfg.camera.yaw_deg += orbit_speed;
        if (rcfg.camera.yaw_deg > 180.0f)
            rcfg.camera.yaw_deg -= 360.0f;
    }); // Right arrow

    // Zoom controls
    static const float zoom_step = 0.05f;
    static const float min_zoom = 0.5f;
    static const float max_zoom = 2.0f;

    key_manager.on_key_pressed(KEY_MINUS, [&rcfg]() {
        rcfg.camera.zoom =
            std::clamp(rcfg.camera.zoom + zoom_step, min_zoom, max_zoom);
    }); // -

    key_manager.on_key_pressed(KEY_EQUAL, [&rcfg]() {
        rcfg.camera.zoom =
            std::clamp(rcfg.camera.zoom - zoom_step, min_zoom, max_zoom);
    }); // =

    LOG_INFO("Keyboard shortcuts registered successfully");
}
