#pragma once

#include "chat_log.hpp"
#include "connection.hpp"
#include "game_state.hpp"
#include "hook_state_machine.hpp"
#include "movement_model.hpp"
#include "player_sync.hpp"
#include "player_table.hpp"
#include "engine/emulator.hpp"
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace pikelink::client {

// What the renderer needs to draw one remote player
struct PlayerSprite {
    protocol::PlayerId id = 0;
    glm::ivec2 position{0, 0};  // Screen pixels, unscaled
    movement::FrameIndex frame;
};

/**
 * Per-frame orchestration. Each update():
 *   1. if the phase is Normal and the emulator budget elapsed (or fast mode
 *      is on), step one frame and feed the new local state to PlayerSync;
 *   2. if the network budget elapsed, run one outbound and one inbound pass.
 * Input is drained before update() and rendering happens after it. The two
 * budgets are tracked separately.
 */
class SessionDriver {
public:
    static constexpr uint64_t FRAME_NS = 1'000'000'000ull / 60;

    SessionDriver(engine::Emulator& emulator, Connection& connection, size_t chat_history = 64);
    ~SessionDriver();

    SessionDriver(const SessionDriver&) = delete;
    SessionDriver& operator=(const SessionDriver&) = delete;

    void update(uint64_t now_ns);

    void set_fast_mode(bool enabled) { fast_mode_ = enabled; }
    bool fast_mode() const { return fast_mode_; }

    void submit_chat(const std::string& text) { sync_.send_chat(text); }

    // Remote players on screen, relative to the local player
    std::vector<PlayerSprite> visible_players() const;

    engine::Emulator& emulator() { return emulator_; }
    ChatLog& chat() { return chat_; }
    const ChatLog& chat() const { return chat_; }
    const GameData& game_data() const { return game_data_; }
    const PlayerTable& players() const { return players_; }
    const PlayerSync& sync() const { return sync_; }

private:
    engine::Emulator& emulator_;
    PlayerTable players_;
    GameData game_data_;
    ChatLog chat_;
    PlayerSync sync_;
    HookStateMachine hooks_;

    bool fast_mode_ = false;
    uint64_t last_emulator_tick_ns_ = 0;
    uint64_t last_network_tick_ns_ = 0;
};

} // namespace pikelink::client
