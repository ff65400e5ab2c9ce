#include "game.hpp"
#include "SDL3/SDL_log.h"
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pikelink::client {

Game::Game(ClientConfig config) : config_(std::move(config)) {}

Game::~Game() {
    shutdown();
}

bool Game::init() {
    if (!init_engine()) {
        return false;
    }
    initialized_ = true;

    if (!core_.load(config_.emulator_core)) {
        return false;
    }
    if (!load_cartridge()) {
        return false;
    }

    auto id = network_.connect(config_.host, config_.port);
    SDL_Log("Game::init: Joined %s:%u as player %u", config_.host.c_str(), static_cast<unsigned>(config_.port), id);

    driver_ = std::make_unique<SessionDriver>(*core_.emulator(), network_, config_.chat_history);

    return on_init();
}

void Game::shutdown() {
    if (!initialized_) return;
    initialized_ = false;

    on_shutdown();
    // The driver holds the emulator hook and a reference to the connection
    driver_.reset();
    network_.disconnect();
    core_.unload();
    shutdown_engine();
}

bool Game::load_cartridge() {
    std::ifstream file(config_.rom_path, std::ios::binary);
    if (!file.is_open()) {
        SDL_Log("Game::load_cartridge: Failed to open ROM %s", config_.rom_path.c_str());
        return false;
    }
    std::vector<uint8_t> rom{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (rom.empty()) {
        SDL_Log("Game::load_cartridge: ROM %s is empty", config_.rom_path.c_str());
        return false;
    }

    if (!core_.emulator()->load_cartridge(rom, config_.save_path)) {
        SDL_Log("Game::load_cartridge: Core rejected %s", config_.rom_path.c_str());
        return false;
    }
    SDL_Log("Game::load_cartridge: Loaded %s (%zu bytes)", config_.rom_path.c_str(), rom.size());
    return true;
}

bool Game::on_init() {
    int width = Renderer::window_width(config_.scale, config_.chat_width);
    int height = Renderer::window_height(config_.scale);
    if (!init_window(width, height, "PikeLink - Player " + std::to_string(network_.local_player_id()))) {
        return false;
    }
    return renderer_.init(renderer(), config_.scale, config_.chat_width, config_.sprite_sheet);
}

void Game::on_shutdown() {
    renderer_.shutdown();
    shutdown_window();
}

void Game::on_update(uint64_t now_ns) {
    apply_input();
    driver_->update(now_ns);
}

void Game::on_render() {
    renderer_.render(*driver_, input().target());
}

void Game::apply_input() {
    const auto& in = input();

    for (const auto& event : in.button_events()) {
        driver_->emulator().set_button(event.button, event.pressed);
    }
    driver_->set_fast_mode(in.fast_mode());

    ChatEdit edit{in.typed_text(), in.backspaces(), in.chat_submitted(), in.chat_cancelled()};
    std::string line = driver_->chat().apply(edit);
    if (!line.empty()) {
        driver_->submit_chat(line);
    }
}

} // namespace pikelink::client
