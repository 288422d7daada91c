#include <iostream>

#include <imgui.h>
#include <raylib.h>
#include <rlImGui.h>

#include "config_manager.hpp"
#include "input/key_manager.hpp"
#include "input/keys.hpp"
#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "render/types/window.hpp"
#include "simulation/simulation.hpp"
#include "utility/clock.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

void run() {
    LOG_INFO("Starting shaker bed application");

    ConfigManager config_manager;
    const BedConfig cfg =
        config_manager.load_or_default(ConfigManager::DEFAULT_CONFIG_FILE);

    shakerbed::SteadyClock clock;
    Simulation sim(cfg, clock);

    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
    InitWindow(1080, 800, "3D Shaker Bed");
    if (!IsWindowReady()) {
        throw shakerbed::RenderError("Failed to open window");
    }

    WindowConfig wcfg = {GetScreenWidth(), GetScreenHeight(), 340};
    Config rcfg;

    SetTargetFPS(cfg.tick_rate);
    rlImGuiSetup(true);

    ImGui::GetIO().IniFilename = nullptr;

    RenderManager rman(wcfg, config_manager);

    KeyManager key_manager;
    bool should_exit = false;
    setup_keys(key_manager, sim, rcfg, config_manager, should_exit);

    while (!WindowShouldClose()) {
        if (IsWindowResized()) {
            wcfg.screen_width = GetScreenWidth();
            wcfg.screen_height = GetScreenHeight();
            LOG_INFO("Window resized to " + std::to_string(wcfg.screen_width) +
                     "x" + std::to_string(wcfg.screen_height));
            rman.resize(wcfg);
        }

        // Check ImGui capture state
        bool imgui_keyboard_captured = false;
        if (rcfg.show_ui) {
            ImGuiIO &io = ImGui::GetIO();
            imgui_keyboard_captured = io.WantCaptureKeyboard;
        }

        // Process keyboard input
        key_manager.process(imgui_keyboard_captured);

        if (should_exit) {
            break;
        }

        sim.tick();
        if (sim.get_run_state() == Simulation::RunState::Quit) {
            break;
        }

        if (rman.draw_frame(sim, rcfg)) {
            break;
        }
    }

    rlImGuiShutdown();
    CloseWindow();
}

int main() {
    try {
        run();
        LOG_INFO("Application shutting down normally");
        return 0;
    } catch (const shakerbed::ShakerBedException &e) {
        LOG_ERROR("Shaker bed error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        LOG_ERROR("Standard error: " + std::string(e.what()));
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    } catch (...) {
        LOG_ERROR("Unknown error occurred");
        std::cerr << "Unknown error occurred" << std::endl;
        return 1;
    }
}
