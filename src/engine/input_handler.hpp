#pragma once

#include "engine/emulator.hpp"
#include <SDL3/SDL.h>
#include <string>
#include <vector>

namespace pikelink::engine {

enum class KeyboardTarget {
    Emulator,   // Keys drive the joypad
    ChatBox     // Keys edit the chat input line
};

struct ButtonEvent {
    Button button;
    bool pressed;
};

class InputHandler {
public:
    InputHandler() = default;
    ~InputHandler();

    // Window that receives text input while the chat box is focused
    void set_window(SDL_Window* window) { window_ = window; }

    // Process SDL events, returns false if quit requested
    bool process_events();

    KeyboardTarget target() const { return target_; }

    // Joypad changes since the last process_events(), in order
    const std::vector<ButtonEvent>& button_events() const { return button_events_; }

    // Held space runs the emulator unthrottled
    bool fast_mode() const { return fast_mode_; }

    // Chat editing since the last process_events()
    const std::string& typed_text() const { return typed_text_; }
    int backspaces() const { return backspaces_; }
    bool chat_submitted() const { return chat_submitted_; }
    bool chat_cancelled() const { return chat_cancelled_; }

private:
    void handle_emulator_key(SDL_Keycode key, bool pressed);
    void handle_chat_key(SDL_Keycode key);
    void set_target(KeyboardTarget target);

    SDL_Window* window_ = nullptr;
    KeyboardTarget target_ = KeyboardTarget::Emulator;

    std::vector<ButtonEvent> button_events_;
    bool fast_mode_ = false;

    std::string typed_text_;
    int backspaces_ = 0;
    bool chat_submitted_ = false;
    bool chat_cancelled_ = false;
};

} // namespace pikelink::engine
