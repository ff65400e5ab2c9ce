#pragma once

#include "protocol/player_data.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace pikelink::protocol {

// Malformed line: bad JSON, missing or mistyped fields, unknown type tag
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Well-formed event that is not valid where it was received
class ProtocolViolation : public DecodeError {
public:
    using DecodeError::DecodeError;
};

// Relay -> client, first line of every connection
struct PlayerJoin {
    PlayerId id = 0;
    bool operator==(const PlayerJoin&) const = default;
};

struct FullUpdate {
    PlayerId id = 0;
    PlayerData data;
    bool operator==(const FullUpdate&) const = default;
};

struct MovementUpdate {
    PlayerId id = 0;
    MovementData movement;
    bool operator==(const MovementUpdate&) const = default;
};

struct PlayerQuit {
    PlayerId id = 0;
    bool operator==(const PlayerQuit&) const = default;
};

struct Chat {
    PlayerId id = 0;
    std::vector<uint8_t> message;  // Engine-encoded
    bool operator==(const Chat&) const = default;
};

struct BattleDataRequest {
    PlayerId target = 0;
    PlayerId requester = 0;
    bool operator==(const BattleDataRequest&) const = default;
};

struct BattleDataResponse {
    PlayerId target = 0;
    Party party;
    bool operator==(const BattleDataResponse&) const = default;
};

struct UpdateRequest {
    bool operator==(const UpdateRequest&) const = default;
};

using NetworkEvent = std::variant<
    PlayerJoin,
    FullUpdate,
    MovementUpdate,
    PlayerQuit,
    Chat,
    BattleDataRequest,
    BattleDataResponse,
    UpdateRequest>;

// Helper for exhaustive std::visit over NetworkEvent
template<typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* event_name(const NetworkEvent& event);

// Serialize to a single line of JSON, including the trailing '\n'
std::string encode_line(const NetworkEvent& event);

// Parse one line (trailing "\n" or "\r\n" is ignored). Throws DecodeError.
NetworkEvent decode_line(const std::string& line);

// The first line of a connection must be PlayerJoin. Returns the assigned id.
// Throws DecodeError on a malformed line, ProtocolViolation on any other event.
PlayerId decode_handshake(const std::string& line);

} // namespace pikelink::protocol
