#include "input_handler.hpp"
#include "SDL3/SDL_events.h"
#include "SDL3/SDL_keyboard.h"
#include "SDL3/SDL_keycode.h"
#include <string>

namespace pikelink::engine {

InputHandler::~InputHandler() {
    if (window_ && target_ == KeyboardTarget::ChatBox) {
        SDL_StopTextInput(window_);
    }
}

bool InputHandler::process_events() {
    // Reset per-frame deltas
    button_events_.clear();
    typed_text_.clear();
    backspaces_ = 0;
    chat_submitted_ = false;
    chat_cancelled_ = false;

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_EVENT_QUIT) {
            return false;
        }

        if (event.type == SDL_EVENT_KEY_DOWN) {
            if (target_ == KeyboardTarget::Emulator) {
                if (!event.key.repeat) {
                    handle_emulator_key(event.key.key, true);
                }
            } else {
                handle_chat_key(event.key.key);
            }
        }

        if (event.type == SDL_EVENT_KEY_UP && target_ == KeyboardTarget::Emulator) {
            handle_emulator_key(event.key.key, false);
            // Switch on release so the 't' never reaches the chat line
            if (event.key.key == SDLK_T) {
                set_target(KeyboardTarget::ChatBox);
            }
        }

        if (event.type == SDL_EVENT_TEXT_INPUT && target_ == KeyboardTarget::ChatBox) {
            typed_text_ += event.text.text;
        }
    }

    return true;
}

void InputHandler::handle_emulator_key(SDL_Keycode key, bool pressed) {
    // TODO: load key bindings from the client config
    switch (key) {
        case SDLK_UP:     button_events_.push_back({Button::Up, pressed}); break;
        case SDLK_DOWN:   button_events_.push_back({Button::Down, pressed}); break;
        case SDLK_LEFT:   button_events_.push_back({Button::Left, pressed}); break;
        case SDLK_RIGHT:  button_events_.push_back({Button::Right, pressed}); break;
        case SDLK_Z:      button_events_.push_back({Button::A, pressed}); break;
        case SDLK_X:      button_events_.push_back({Button::B, pressed}); break;
        case SDLK_RETURN: button_events_.push_back({Button::Start, pressed}); break;
        case SDLK_RSHIFT: button_events_.push_back({Button::Select, pressed}); break;
        case SDLK_SPACE:  fast_mode_ = pressed; break;
        default: break;
    }
}

void InputHandler::handle_chat_key(SDL_Keycode key) {
    switch (key) {
        case SDLK_RETURN:
            chat_submitted_ = true;
            set_target(KeyboardTarget::Emulator);
            break;
        case SDLK_ESCAPE:
            chat_cancelled_ = true;
            set_target(KeyboardTarget::Emulator);
            break;
        case SDLK_BACKSPACE:
            ++backspaces_;
            break;
        default:
            break;
    }
}

void InputHandler::set_target(KeyboardTarget target) {
    if (target == target_) return;
    target_ = target;

    if (!window_) return;
    if (target_ == KeyboardTarget::ChatBox) {
        SDL_StartTextInput(window_);
        // Key-up events go to the chat box now, so release everything held
        for (Button b : {Button::Up, Button::Down, Button::Left, Button::Right,
                         Button::A, Button::B, Button::Start, Button::Select}) {
            button_events_.push_back({b, false});
        }
        fast_mode_ = false;
    } else {
        SDL_StopTextInput(window_);
    }
}

} // namespace pikelink::engine
