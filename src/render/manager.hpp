#pragma once

#include <raylib.h>
#include <rlImGui.h>

#include "../config_manager.hpp"
#include "bed_renderer.hpp"
#include "control_ui.hpp"
#include "types/context.hpp"
#include "types/window.hpp"

// Orchestrates one presented frame: 3D scene, HUD and the ImGui panel.
class RenderManager {
  public:
    RenderManager(const WindowConfig &wcfg, ConfigManager &config_manager)
        : m_wcfg(wcfg), m_config_manager(config_manager) {}

    ~RenderManager() {}

    void resize(const WindowConfig &wcfg) { m_wcfg = wcfg; }

    bool draw_frame(Simulation &sim, Config &rcfg) {
        Context ctx{sim,           rcfg,           m_wcfg,
                    sim.get_frame(), sim.get_stats(), m_config_manager};

        BeginDrawing();
        ClearBackground(rcfg.background_color);

        m_bed.render(ctx);

        rlImGuiBegin();
        { m_control.render(ctx); }
        rlImGuiEnd();

        EndDrawing();

        return ctx.should_exit;
    }

  private:
    WindowConfig m_wcfg;
    BedRenderer m_bed;
    ControlUI m_control;
    ConfigManager &m_config_manager;
};
