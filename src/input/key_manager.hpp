#pragma once

#include <functional>
#include <vector>

#include <raylib.h>

/**
 * @brief Centralized keyboard input manager using callback-based handlers.
 *
 * Maps raylib key codes to callbacks, optionally gated on Ctrl, Shift or
 * Alt. Handlers are skipped for the frame when ImGui owns the keyboard.
 */
class KeyManager {
  public:
    /**
     * @brief Key input modes for different behaviors.
     */
    enum class Mode {
        Pressed, ///< Triggered once when key is pressed
        Down     ///< Triggered continuously while key is held
    };

    /**
     * @brief Register a handler for key press events.
     * @param key The raylib key code
     * @param handler Function to call when key is pressed
     * @param ctrl Whether Ctrl/Cmd/Super modifier is required
     * @param shift Whether Shift modifier is required
     * @param alt Whether Alt modifier is required
     */
    void on_key_pressed(int key, std::function<void()> handler,
                        bool ctrl = false, bool shift = false,
                        bool alt = false);

    /**
     * @brief Register a handler for key down events (continuous).
     * @param key The raylib key code
     * @param handler Function to call while key is held
     * @param ctrl Whether Ctrl/Cmd/Super modifier is required
     * @param shift Whether Shift modifier is required
     * @param alt Whether Alt modifier is required
     */
    void on_key_down(int key, std::function<void()> handler, bool ctrl = false,
                     bool shift = false, bool alt = false);

    /**
     * @brief Process all registered handlers for the current frame.
     * @param imgui_captured Whether ImGui has captured keyboard input
     */
    void process(bool imgui_captured);

    /**
     * @brief Clear all registered handlers.
     */
    void clear();

  private:
    /**
     * @brief A registered binding.
     */
    struct Handler {
        int key;
        Mode mode;
        bool ctrl;
        bool shift;
        bool alt;
        std::function<void()> callback;
    };

    /**
     * @brief Modifier keys held during the current frame.
     */
    struct Modifiers {
        bool ctrl = false;
        bool shift = false;
        bool alt = false;

        inline bool any() const { return ctrl || shift || alt; }
    };

    static Modifiers read_modifiers();

    /**
     * @brief Whether the handler's key fires this frame with exactly the
     * modifiers it asked for.
     */
    static bool triggered(const Handler &handler, const Modifiers &held);

    void add(int key, Mode mode, std::function<void()> handler, bool ctrl,
             bool shift, bool alt);

    /** @brief Bindings in registration order. */
    std::vector<Handler> m_handlers;
};
