#include "key_manager.hpp"

#include <raylib.h>

void KeyManager::on_key_pressed(int key, std::function<void()> handler,
                                bool ctrl, bool shift, bool alt) {
    add(key, Mode::Pressed, std::move(handler), ctrl, shift, alt);
}

void KeyManager::on_key_down(int key, std::function<void()> handler, bool ctrl,
                             bool shift, bool alt) {
    add(key, Mode::Down, std::move(handler), ctrl, shift, alt);
}

void KeyManager::process(bool imgui_captured) {
    // ImGui text fields own the keyboard while focused
    if (imgui_captured) {
        return;
    }

    const Modifiers held = read_modifiers();
    for (const auto &handler : m_handlers) {
        if (triggered(handler, held)) {
            handler.callback();
        }
    }
}

void KeyManager::clear() { m_handlers.clear(); }

void KeyManager::add(int key, Mode mode, std::function<void()> handler,
                     bool ctrl, bool shift, bool alt) {
    m_handlers.push_back(Handler{key, mode, ctrl, shift, alt,
                                 std::move(handler)});
}

KeyManager::Modifiers KeyManager::read_modifiers() {
    Modifiers m;
    // Cmd/Super counts as Ctrl
    m.ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL) ||
             IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER);
    m.shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
    m.alt = IsKeyDown(KEY_LEFT_ALT) || IsKeyDown(KEY_RIGHT_ALT);
    return m;
}

bool KeyManager::triggered(const Handler &handler, const Modifiers &held) {
    if (handler.ctrl != held.ctrl || handler.shift != held.shift ||
        handler.alt != held.alt) {
        return false;
    }

    switch (handler.mode) {
    case Mode::Pressed:
        return IsKeyPressed(handler.key);
    case Mode::Down:
        return IsKeyDown(handler.key);
    }
    return false;
}
