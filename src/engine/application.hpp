#pragma once

#include "engine/input_handler.hpp"
#include <SDL3/SDL.h>
#include <cstdint>
#include <string>

namespace pikelink::engine {

/**
 * Base application class that owns the SDL lifecycle, main loop,
 * the window with its 2D renderer, and input handling.
 *
 * Game-specific subclasses override on_init/on_update/on_render/on_shutdown
 * and draw through renderer().
 */
class Application {
public:
    Application();
    virtual ~Application();

    /** Initialize SDL subsystems. Call before on_init(). */
    bool init_engine();

    /** Run the main loop until quit() is called. */
    void run();

    /** Shut down SDL. Call after on_shutdown(). */
    void shutdown_engine();

    /** Request the main loop to stop. */
    void quit() { running_ = false; }

    float fps() const { return fps_; }

protected:
    /** Game-specific initialization (window, textures, etc). */
    virtual bool on_init() = 0;

    /** Game-specific shutdown. */
    virtual void on_shutdown() {}

    /** Called once per loop iteration with a monotonic timestamp in nanoseconds. */
    virtual void on_update(uint64_t now_ns) = 0;

    /** Called once per loop iteration after on_update. */
    virtual void on_render() = 0;

    InputHandler& input() { return input_; }
    const InputHandler& input() const { return input_; }

    /** Create the window and its renderer. */
    bool init_window(int width, int height, const std::string& title);

    /** Destroy the renderer and the window. */
    void shutdown_window();

    SDL_Renderer* renderer() const { return renderer_; }
    SDL_Window* window() const { return window_; }

    int screen_width() const { return width_; }
    int screen_height() const { return height_; }

private:
    InputHandler input_;
    bool running_ = false;
    float fps_ = 0.0f;
    int frame_count_ = 0;
    uint64_t fps_timer_ = 0;

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    int width_ = 0;
    int height_ = 0;
};

} // namespace pikelink::engine
