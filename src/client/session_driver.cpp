#include "session_driver.hpp"
#include "engine_state.hpp"
#include <cstdint>
#include <vector>

namespace pikelink::client {

SessionDriver::SessionDriver(engine::Emulator& emulator, Connection& connection, size_t chat_history)
    : emulator_(emulator)
    , chat_(chat_history)
    , sync_(connection, players_, game_data_, chat_)
    , hooks_(game_data_, players_) {
    emulator_.set_step_hook([this](engine::Emulator& emu) {
        hooks_.on_step(emu);
    });
}

SessionDriver::~SessionDriver() {
    emulator_.set_step_hook(nullptr);
}

void SessionDriver::update(uint64_t now_ns) {
    if (fast_mode_ || now_ns - last_emulator_tick_ns_ >= FRAME_NS) {
        last_emulator_tick_ns_ = now_ns;
        if (game_data_.phase == SessionPhase::Normal) {
            emulator_.step_one_frame();
            sync_.update_player_data(extract_player_data(emulator_));
        }
    }

    if (now_ns - last_network_tick_ns_ >= FRAME_NS) {
        last_network_tick_ns_ = now_ns;
        sync_.send_update();
        sync_.recv_update(emulator_);
    }
}

std::vector<PlayerSprite> SessionDriver::visible_players() const {
    const auto& self = sync_.last_state();

    std::vector<PlayerSprite> sprites;
    for (const auto& player : players_.snapshot()) {
        if (!movement::is_visible_to(self, player)) continue;

        PlayerSprite sprite;
        sprite.id = player.id;
        sprite.position = movement::relative_draw_position(self, player);
        sprite.frame = movement::frame_index(player.movement.direction, player.movement.walk_counter);
        sprites.push_back(sprite);
    }
    return sprites;
}

} // namespace pikelink::client
