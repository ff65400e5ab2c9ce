#pragma once

#include "session_driver.hpp"
#include "engine/input_handler.hpp"
#include <SDL3/SDL.h>
#include <string>

namespace pikelink::client {

/**
 * Draws one frame: the emulator screen scaled up, remote players on top of
 * it, and the chat panel to the right.
 */
class Renderer {
public:
    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // sprite_sheet may be empty; players are then drawn as boxes
    bool init(SDL_Renderer* renderer, int scale, int chat_width, const std::string& sprite_sheet);
    void shutdown();

    void render(SessionDriver& driver, engine::KeyboardTarget target);

    static int window_width(int scale, int chat_width) { return engine::SCREEN_WIDTH * scale + chat_width; }
    static int window_height(int scale) { return engine::SCREEN_HEIGHT * scale; }

private:
    void draw_screen(SessionDriver& driver);
    void draw_players(const SessionDriver& driver);
    void draw_chat(const ChatLog& chat, bool focused);

    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* screen_ = nullptr;
    SDL_Texture* sprites_ = nullptr;
    int scale_ = 1;
    int chat_width_ = 0;
};

} // namespace pikelink::client
