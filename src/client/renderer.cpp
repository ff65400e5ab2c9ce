#include "renderer.hpp"
#include "movement_model.hpp"
#include "protocol/text_codec.hpp"
#include "SDL3/SDL_error.h"
#include "SDL3/SDL_log.h"
#include "SDL3/SDL_render.h"
#include "SDL3/SDL_surface.h"
#include <algorithm>
#include <string>
#include <vector>

namespace pikelink::client {

namespace {

// SDL debug font glyph size
constexpr int GLYPH = SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE;
constexpr int LINE_SPACING = GLYPH + 4;
constexpr int PADDING = 6;

// Split a line into rows of at most `columns` characters
std::vector<std::string> wrap(const std::string& line, size_t columns) {
    std::vector<std::string> rows;
    if (columns == 0) return rows;
    for (size_t i = 0; i < line.size(); i += columns) {
        rows.push_back(line.substr(i, columns));
    }
    if (rows.empty()) rows.emplace_back();
    return rows;
}

} // anonymous namespace

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init(SDL_Renderer* renderer, int scale, int chat_width, const std::string& sprite_sheet) {
    renderer_ = renderer;
    scale_ = scale;
    chat_width_ = chat_width;

    screen_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_ARGB8888, SDL_TEXTUREACCESS_STREAMING,
                                engine::SCREEN_WIDTH, engine::SCREEN_HEIGHT);
    if (!screen_) {
        SDL_Log("Renderer::init: Failed to create screen texture: %s", SDL_GetError());
        return false;
    }
    SDL_SetTextureScaleMode(screen_, SDL_SCALEMODE_NEAREST);

    if (!sprite_sheet.empty()) {
        SDL_Surface* surface = SDL_LoadBMP(sprite_sheet.c_str());
        if (!surface) {
            SDL_Log("Renderer::init: Failed to load sprite sheet %s: %s", sprite_sheet.c_str(), SDL_GetError());
        } else {
            // Magenta marks transparent pixels
            SDL_SetSurfaceColorKey(surface, true, SDL_MapSurfaceRGB(surface, 255, 0, 255));
            sprites_ = SDL_CreateTextureFromSurface(renderer_, surface);
            SDL_DestroySurface(surface);
            if (sprites_) {
                SDL_SetTextureScaleMode(sprites_, SDL_SCALEMODE_NEAREST);
            } else {
                SDL_Log("Renderer::init: Failed to create sprite texture: %s", SDL_GetError());
            }
        }
    }

    return true;
}

void Renderer::shutdown() {
    if (sprites_) {
        SDL_DestroyTexture(sprites_);
        sprites_ = nullptr;
    }
    if (screen_) {
        SDL_DestroyTexture(screen_);
        screen_ = nullptr;
    }
    renderer_ = nullptr;
}

void Renderer::render(SessionDriver& driver, engine::KeyboardTarget target) {
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);

    draw_screen(driver);
    draw_players(driver);
    draw_chat(driver.chat(), target == engine::KeyboardTarget::ChatBox);

    SDL_RenderPresent(renderer_);
}

void Renderer::draw_screen(SessionDriver& driver) {
    auto& emulator = driver.emulator();
    // Only upload when the core finished a new frame; the texture keeps the last one
    if (emulator.poll_screen()) {
        auto pixels = emulator.framebuffer();
        if (pixels.size() >= static_cast<size_t>(engine::SCREEN_WIDTH * engine::SCREEN_HEIGHT)) {
            SDL_UpdateTexture(screen_, nullptr, pixels.data(), engine::SCREEN_WIDTH * sizeof(uint32_t));
        }
    }

    SDL_FRect dst{0.0f, 0.0f,
                  static_cast<float>(engine::SCREEN_WIDTH * scale_),
                  static_cast<float>(engine::SCREEN_HEIGHT * scale_)};
    SDL_RenderTexture(renderer_, screen_, nullptr, &dst);
}

void Renderer::draw_players(const SessionDriver& driver) {
    const float size = static_cast<float>(movement::TILE_SIZE * scale_);

    for (const auto& sprite : driver.visible_players()) {
        SDL_FRect dst{static_cast<float>(sprite.position.x * scale_),
                      static_cast<float>(sprite.position.y * scale_),
                      size, size};

        if (sprites_) {
            SDL_FRect src{static_cast<float>(sprite.frame.index * movement::TILE_SIZE), 0.0f,
                          static_cast<float>(movement::TILE_SIZE),
                          static_cast<float>(movement::TILE_SIZE)};
            SDL_RenderTextureRotated(renderer_, sprites_, &src, &dst, 0.0, nullptr,
                                     sprite.frame.flip_horizontal ? SDL_FLIP_HORIZONTAL : SDL_FLIP_NONE);
        } else {
            SDL_SetRenderDrawColor(renderer_, 200, 40, 40, 255);
            SDL_RenderFillRect(renderer_, &dst);
        }
    }
}

void Renderer::draw_chat(const ChatLog& chat, bool focused) {
    const float left = static_cast<float>(engine::SCREEN_WIDTH * scale_);
    const float height = static_cast<float>(engine::SCREEN_HEIGHT * scale_);

    SDL_FRect panel{left, 0.0f, static_cast<float>(chat_width_), height};
    SDL_SetRenderDrawColor(renderer_, 24, 24, 32, 255);
    SDL_RenderFillRect(renderer_, &panel);

    const size_t columns = static_cast<size_t>(std::max(0, (chat_width_ - 2 * PADDING) / GLYPH));

    // Input line pinned to the bottom
    float y = height - PADDING - GLYPH;
    if (focused) {
        SDL_SetRenderDrawColor(renderer_, 60, 60, 90, 255);
        SDL_FRect input_box{left, y - 2.0f, static_cast<float>(chat_width_), static_cast<float>(GLYPH + 4)};
        SDL_RenderFillRect(renderer_, &input_box);
    }
    std::string input = "> " + chat.input();
    if (input.size() > columns && columns > 0) {
        input = input.substr(input.size() - columns);
    }
    SDL_SetRenderDrawColor(renderer_, 255, 255, 255, 255);
    SDL_RenderDebugText(renderer_, left + PADDING, y, input.c_str());
    y -= LINE_SPACING + 4;

    // Newest lines first, walking upward until the panel is full
    const auto& lines = chat.lines();
    for (auto it = lines.rbegin(); it != lines.rend() && y >= PADDING; ++it) {
        std::string text = protocol::text::decode(it->sender) + ": " + protocol::text::decode(it->message);
        auto rows = wrap(text, columns);
        for (auto row = rows.rbegin(); row != rows.rend() && y >= PADDING; ++row) {
            SDL_RenderDebugText(renderer_, left + PADDING, y, row->c_str());
            y -= LINE_SPACING;
        }
    }
}

} // namespace pikelink::client
