#include "player_sync.hpp"
#include "engine_state.hpp"
#include "protocol/text_codec.hpp"
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace pikelink::client {

using namespace pikelink::protocol;

PlayerSync::PlayerSync(Connection& connection, PlayerTable& players, GameData& game_data, ChatLog& chat)
    : connection_(connection)
    , players_(players)
    , game_data_(game_data)
    , chat_(chat) {
    last_state_.id = connection_.local_player_id();
}

void PlayerSync::update_player_data(PlayerData new_state) {
    new_state.id = local_id();
    if (new_state != last_state_) {
        last_state_ = std::move(new_state);
        new_update_ = true;
    }
}

void PlayerSync::send_update() {
    if (new_update_) {
        connection_.send(FullUpdate{local_id(), last_state_});
        new_update_ = false;
    }

    if (game_data_.network_request.type == NetworkRequestType::Battle) {
        connection_.send(BattleDataRequest{game_data_.network_request.peer, local_id()});
        game_data_.network_request = NetworkRequest::none();
    }

    for (auto& message : pending_chat_) {
        connection_.send(Chat{local_id(), std::move(message)});
    }
    pending_chat_.clear();
}

void PlayerSync::recv_update(engine::Emulator& emulator) {
    connection_.poll_messages([this, &emulator](const NetworkEvent& event) {
        handle_event(event, emulator);
    });
}

void PlayerSync::send_chat(const std::string& text) {
    if (text.empty()) return;

    auto message = text::encode_to_vector(text);
    chat_.push(ChatLine{last_state_.name, message});
    pending_chat_.push_back(std::move(message));
}

void PlayerSync::handle_event(const NetworkEvent& event, engine::Emulator& emulator) {
    std::visit(Overloaded{
        [&](const PlayerJoin& e) {
            // Only valid as the handshake; the peer's entry arrives with its first FullUpdate
            std::cout << "[PlayerSync] Player " << e.id << " joined" << std::endl;
        },
        [&](const FullUpdate& e) {
            PlayerData data = e.data;
            data.id = e.id;
            players_.upsert(data);
        },
        [&](const MovementUpdate& e) {
            // Unknown ids are ignored, never create a partial entry
            players_.update_movement(e.id, e.movement);
        },
        [&](const PlayerQuit& e) {
            if (players_.remove(e.id)) {
                std::cout << "[PlayerSync] Player " << e.id << " left" << std::endl;
            }
        },
        [&](const Chat& e) {
            chat_.push(ChatLine{display_name(e.id), e.message});
        },
        [&](const BattleDataRequest& e) {
            connection_.send(BattleDataResponse{e.requester, extract_party(emulator)});
        },
        [&](const BattleDataResponse& e) {
            std::cout << "[PlayerSync] Received party (" << static_cast<int>(e.party.num_pokemon)
                      << " pokemon), starting battle" << std::endl;
            game_data_.phase = SessionPhase::Normal;
            set_battle(emulator, e.party);
        },
        [&](const UpdateRequest&) {
            new_update_ = true;
        },
    }, event);
}

std::vector<uint8_t> PlayerSync::display_name(PlayerId id) const {
    if (auto player = players_.find(id)) {
        return player->name;
    }
    return text::encode_to_vector("UNKNOWN");
}

} // namespace pikelink::client
