#pragma once

#include "chat_log.hpp"
#include "connection.hpp"
#include "game_state.hpp"
#include "player_table.hpp"
#include "engine/emulator.hpp"
#include "protocol/network_event.hpp"
#include <string>
#include <vector>

namespace pikelink::client {

// Reconciles local engine state with the relay.
//
// Outbound: one FullUpdate per change of the local PlayerData, one
// BattleDataRequest per pending battle request, one Chat per submitted line.
// Inbound: events are applied one at a time on the driver thread; this is the
// only place the PlayerTable is written.
class PlayerSync {
public:
    PlayerSync(Connection& connection, PlayerTable& players, GameData& game_data, ChatLog& chat);

    protocol::PlayerId local_id() const { return connection_.local_player_id(); }
    const protocol::PlayerData& last_state() const { return last_state_; }

    // Record the latest local state; marks it for broadcast if it changed
    void update_player_data(protocol::PlayerData new_state);

    // Outbound pass
    void send_update();

    // Inbound pass. The emulator is needed to answer battle requests and load parties.
    void recv_update(engine::Emulator& emulator);

    // Queue a chat line (plain text, encoded for the engine) and echo it locally
    void send_chat(const std::string& text);

    void handle_event(const protocol::NetworkEvent& event, engine::Emulator& emulator);

private:
    std::vector<uint8_t> display_name(protocol::PlayerId id) const;

    Connection& connection_;
    PlayerTable& players_;
    GameData& game_data_;
    ChatLog& chat_;

    protocol::PlayerData last_state_;
    bool new_update_ = false;
    std::vector<std::vector<uint8_t>> pending_chat_;
};

} // namespace pikelink::client
