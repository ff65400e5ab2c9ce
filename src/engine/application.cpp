#include "application.hpp"
#include "SDL3/SDL_error.h"
#include "SDL3/SDL_init.h"
#include "SDL3/SDL_render.h"
#include "SDL3/SDL_timer.h"
#include "SDL3/SDL_video.h"
#include <cstdint>
#include <iostream>
#include <string>

namespace pikelink::engine {

Application::Application() = default;

Application::~Application() {
    shutdown_window();
}

bool Application::init_engine() {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        std::cerr << "Failed to initialize SDL: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

void Application::run() {
    running_ = true;
    fps_timer_ = SDL_GetTicksNS();

    while (running_) {
        uint64_t current_time = SDL_GetTicksNS();

        // FPS counter
        frame_count_++;
        if (current_time - fps_timer_ >= SDL_NS_PER_SECOND) {
            fps_ = static_cast<float>(frame_count_);
            frame_count_ = 0;
            fps_timer_ = current_time;
        }

        // Process input
        if (!input_.process_events()) {
            running_ = false;
            break;
        }

        on_update(current_time);
        on_render();
    }
}

void Application::shutdown_engine() {
    SDL_Quit();
}

bool Application::init_window(int width, int height, const std::string& title) {
    if (!SDL_CreateWindowAndRenderer(title.c_str(), width, height, 0, &window_, &renderer_)) {
        std::cerr << "Failed to create window: " << SDL_GetError() << std::endl;
        return false;
    }
    width_ = width;
    height_ = height;

    // Vsync paces rendering; emulation keeps its own clock
    SDL_SetRenderVSync(renderer_, 1);
    input_.set_window(window_);
    return true;
}

void Application::shutdown_window() {
    input_.set_window(nullptr);
    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_) {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
}

} // namespace pikelink::engine
