#include "key_manager.hpp"

#include <utility>

void KeyManager::on_key_pressed(int key, std::function<void()> handler,
                                unsigned mods) {
    add(key, Mode::Pressed, mods, std::move(handler));
}

void KeyManager::on_key_down(int key, std::function<void()> handler,
                             unsigned mods) {
    add(key, Mode::Down, mods, std::move(handler));
}

void KeyManager::on_key_repeat(int key, std::function<void()> handler,
                               unsigned mods) {
    add(key, Mode::Repeat, mods, std::move(handler));
}

void KeyManager::add(int key, Mode mode, unsigned mods,
                     std::function<void()> handler) {
    m_handlers.push_back(Handler{key, mode, mods, std::move(handler)});
}

void KeyManager::process(bool keyboard_captured) const {
    if (keyboard_captured) {
        return;
    }

    const unsigned mods = held_modifiers();
    for (const auto &handler : m_handlers) {
        if (handler.mods != mods) {
            continue;
        }

        bool triggered = false;
        switch (handler.mode) {
        case Mode::Pressed:
            triggered = IsKeyPressed(handler.key);
            break;
        case Mode::Down:
            triggered = IsKeyDown(handler.key);
            break;
        case Mode::Repeat:
            triggered = IsKeyPressedRepeat(handler.key);
            break;
        }

        if (triggered) {
            handler.callback();
        }
    }
}

unsigned KeyManager::held_modifiers() {
    unsigned mods = None;
    if (IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL) ||
        IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER)) {
        mods |= Ctrl;
    }
    if (IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT)) {
        mods |= Shift;
    }
    if (IsKeyDown(KEY_LEFT_ALT) || IsKeyDown(KEY_RIGHT_ALT)) {
        mods |= Alt;
    }
    return mods;
}
