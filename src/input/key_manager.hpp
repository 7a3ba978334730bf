#pragma once

#include <functional>
#include <vector>

#include <raylib.h>

/**
 * @brief Callback-based keyboard dispatcher.
 *
 * A handler fires only when the held modifiers match its mask exactly, so
 * "S" and "Ctrl+S" can be bound separately. Nothing fires while ImGui owns
 * the keyboard.
 */
class KeyManager {
  public:
    /**
     * @brief Modifier bits; Ctrl also covers Cmd/Super.
     */
    enum Modifier : unsigned { None = 0, Ctrl = 1u, Shift = 2u, Alt = 4u };

    /**
     * @brief Key input modes for different behaviors.
     */
    enum class Mode {
        Pressed, ///< Once when the key goes down
        Down,    ///< Every frame while held
        Repeat   ///< On the OS key-repeat cadence while held
    };

    KeyManager() = default;
    KeyManager(const KeyManager &) = delete;
    KeyManager &operator=(const KeyManager &) = delete;

    void on_key_pressed(int key, std::function<void()> handler,
                        unsigned mods = None);
    void on_key_down(int key, std::function<void()> handler,
                     unsigned mods = None);
    void on_key_repeat(int key, std::function<void()> handler,
                       unsigned mods = None);

    /**
     * @brief Runs the handlers triggered this frame.
     * @param keyboard_captured Whether ImGui has captured keyboard input
     */
    void process(bool keyboard_captured) const;

  private:
    struct Handler {
        int key;
        Mode mode;
        unsigned mods;
        std::function<void()> callback;
    };

    /** @brief Modifier mask held right now */
    static unsigned held_modifiers();

    void add(int key, Mode mode, unsigned mods, std::function<void()> handler);

    std::vector<Handler> m_handlers;
};
