#pragma once

#include "protocol/player_data.hpp"
#include <cstdint>
#include <deque>

namespace pikelink::client {

enum class SessionPhase {
    Normal,     // Emulator steps every frame
    Waiting     // Battle requested, emulator paused until the peer's party arrives
};

// Whether a hook is substituting its own data for what the engine would read
enum class DataState {
    Normal,
    Hacked
};

enum class NetworkRequestType {
    None,
    Battle
};

struct NetworkRequest {
    NetworkRequestType type = NetworkRequestType::None;
    protocol::PlayerId peer = 0;

    static NetworkRequest none() { return {}; }
    static NetworkRequest battle(protocol::PlayerId peer) { return {NetworkRequestType::Battle, peer}; }

    bool operator==(const NetworkRequest&) const = default;
};

struct InterceptionState {
    DataState sprite_state = DataState::Normal;
    DataState text_state = DataState::Normal;
    protocol::PlayerId last_interaction = 0;
    std::deque<uint8_t> pending_message;
};

// Per-session state shared by the hooks, PlayerSync and the session driver.
// Only touched from the driver thread.
struct GameData {
    SessionPhase phase = SessionPhase::Normal;
    NetworkRequest network_request;
    InterceptionState interception;
};

} // namespace pikelink::client
