#pragma once

#include <raylib.h>

#include "irenderer.hpp"

/**
 * @brief Draws the 3D scene: floor, back wall, tilted bed with its rim and
 * shadow, actuator markers and the pellets resting on the bed plane.
 *
 * Only reads the frame snapshot from the context; never touches the world.
 */
class BedRenderer : public IRenderer {
  public:
    BedRenderer() = default;
    ~BedRenderer() override = default;

    void render(Context &ctx) override;

    /**
     * @brief Camera for the given orbit state, looking at the bed centre
     */
    static Camera3D make_camera(const CameraState &state);

  private:
    void draw_environment(const Config &rcfg) const;
    void draw_bed(const Config &rcfg, Vector3 normal, float radius,
                  int segments) const;
    void draw_shadow(const Config &rcfg, Vector3 normal, float radius,
                     int segments) const;
    void draw_actuators(const Config &rcfg, const ActuatorLayout &layout,
                        const Lifts &lifts, Vector3 normal) const;
    void draw_pellets(const Config &rcfg, const mailbox::FrameSnapshot &frame,
                      Vector3 normal, float pellet_radius) const;
    void draw_hud(const Context &ctx) const;
};
