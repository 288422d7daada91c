#ifndef __CONTROL_UI_HPP
#define __CONTROL_UI_HPP

#include <string>

#include <fmt/format.h>
#include <imgui.h>
#include <raylib.h>

#include "../mailbox/command/cmds.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"
#include "irenderer.hpp"

class ControlUI : public IRenderer {
  public:
    ControlUI() = default;
    ~ControlUI() override = default;

    void render(Context &ctx) override {
        if (!ctx.rcfg.show_ui)
            return;
        render_ui(ctx);
    }

  private:
    void render_ui(Context &ctx) {
        auto &wcfg = ctx.wcfg;
        auto &sim = ctx.sim;
        const auto &frame = ctx.frame;

        auto window_size =
            ImVec2{(float)wcfg.panel_width, (float)wcfg.screen_height * .6f};
        auto window_x = (float)(wcfg.screen_width - wcfg.panel_width);

        ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.);
        ImGui::Begin("Shaker bed", NULL);
        ImGui::SetWindowPos(ImVec2{window_x, 0.f}, ImGuiCond_Appearing);
        ImGui::SetWindowSize(window_size, ImGuiCond_Appearing);

        ImGui::SeparatorText("Gestures");
        if (ImGui::Button("Flatten")) {
            sim.push_command(mailbox::command::SelectGesture{Gesture::Flatten});
        }
        ImGui::SameLine();
        if (ImGui::Button("Scramble")) {
            sim.push_command(
                mailbox::command::SelectGesture{Gesture::Scramble});
        }
        ImGui::SameLine();
        if (ImGui::Button("Dump")) {
            sim.push_command(mailbox::command::SelectGesture{Gesture::Dump});
        }

        ImGui::SeparatorText("Controls");
        if (ImGui::Button(frame.paused ? "Resume" : "Pause")) {
            sim.push_command(mailbox::command::TogglePause{});
        }
        ImGui::SameLine();
        if (ImGui::Button(frame.loop ? "Loop: on" : "Loop: off")) {
            sim.push_command(mailbox::command::ToggleLoop{});
        }
        ImGui::SameLine();
        if (ImGui::Button("Reset world")) {
            sim.push_command(mailbox::command::ResetWorld{});
        }

        ImGui::SeparatorText("Status");
        ImGui::Text("Mode: %s", frame.label.c_str());
        if (frame.step_count > 0) {
            ImGui::Text("Step: %d / %d", frame.step_index + 1,
                        frame.step_count);
        }
        ImGui::Text("Lifts: %.2f %.2f %.2f", frame.lifts[0], frame.lifts[1],
                    frame.lifts[2]);
        ImGui::Text("Impulse: %.2f", frame.impulse);
        ImGui::Text("Force: (%.2f, %.2f)", frame.force.x, frame.force.y);
        ImGui::Text("Pellets: %d", frame.pellet_count());
        ImGui::Text("TPS: %d  step %.3f ms", ctx.stats.effective_tps,
                    (double)ctx.stats.last_step_ns / 1e6);

        ImGui::SeparatorText("View");
        ImGui::Checkbox("HUD", &ctx.rcfg.show_hud);
        ImGui::SameLine();
        ImGui::Checkbox("Shadow", &ctx.rcfg.show_shadow);
        ImGui::SameLine();
        ImGui::Checkbox("Actuators", &ctx.rcfg.show_actuators);
        ImGui::SliderFloat("Orbit", &ctx.rcfg.camera.yaw_deg, -180.f, 180.f,
                           "%.0f deg");
        ImGui::SliderFloat("Zoom", &ctx.rcfg.camera.zoom, 0.5f, 2.0f, "%.2f");

        ImGui::SeparatorText("Configuration");
        if (ImGui::Button("Save config")) {
            save_config(ctx);
        }
        if (!m_save_status.empty()) {
            ImGui::TextUnformatted(m_save_status.c_str());
        }

        if (ImGui::Button("Quit")) {
            ctx.should_exit = true;
        }

        ImGui::End();
        ImGui::PopStyleVar();
    }

    void save_config(Context &ctx) {
        try {
            ctx.config.save_config(ConfigManager::DEFAULT_CONFIG_FILE,
                                   ctx.sim.get_config());
            m_save_status = fmt::format("Saved to {}",
                                        ConfigManager::DEFAULT_CONFIG_FILE);
        } catch (const shakerbed::IOError &e) {
            LOG_ERROR("Failed to save configuration: " + std::string(e.what()));
            m_save_status = e.what();
        }
    }

    std::string m_save_status;
};

#endif
