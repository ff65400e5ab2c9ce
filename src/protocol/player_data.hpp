#pragma once

#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <vector>

namespace pikelink::protocol {

using PlayerId = uint32_t;

// Facing values as the engine stores them in the player's sprite state
enum class Direction : uint8_t {
    Down = 0x00,
    Up = 0x04,
    Left = 0x08,
    Right = 0x0C,
};

struct MovementData {
    uint8_t map_id = 0;
    uint8_t map_x = 0;
    uint8_t map_y = 0;
    Direction direction = Direction::Down;
    uint8_t walk_counter = 0;  // 8 at the start of a step, 0 when standing on (map_x, map_y)

    bool operator==(const MovementData&) const = default;
};

struct PlayerData {
    PlayerId id = 0;
    std::vector<uint8_t> name;  // Engine-encoded
    MovementData movement;

    bool operator==(const PlayerData&) const = default;
};

constexpr size_t kPartySize = 6;

struct PokemonSlot {
    uint8_t species = 0;
    uint8_t level = 0;

    bool operator==(const PokemonSlot&) const = default;
};

struct Party {
    uint8_t num_pokemon = 0;
    std::array<PokemonSlot, kPartySize> pokemon{};

    bool operator==(const Party&) const = default;
};

// JSON mapping (used by the line protocol)

inline void to_json(nlohmann::json& j, const MovementData& m) {
    j = nlohmann::json{
        {"map_id", m.map_id},
        {"map_x", m.map_x},
        {"map_y", m.map_y},
        {"direction", static_cast<uint8_t>(m.direction)},
        {"walk_counter", m.walk_counter},
    };
}

inline void from_json(const nlohmann::json& j, MovementData& m) {
    j.at("map_id").get_to(m.map_id);
    j.at("map_x").get_to(m.map_x);
    j.at("map_y").get_to(m.map_y);
    m.direction = static_cast<Direction>(j.at("direction").get<uint8_t>());
    j.at("walk_counter").get_to(m.walk_counter);
}

inline void to_json(nlohmann::json& j, const PlayerData& p) {
    j = nlohmann::json{{"id", p.id}, {"name", p.name}, {"movement", p.movement}};
}

inline void from_json(const nlohmann::json& j, PlayerData& p) {
    j.at("id").get_to(p.id);
    j.at("name").get_to(p.name);
    j.at("movement").get_to(p.movement);
}

inline void to_json(nlohmann::json& j, const PokemonSlot& s) {
    j = nlohmann::json{{"species", s.species}, {"level", s.level}};
}

inline void from_json(const nlohmann::json& j, PokemonSlot& s) {
    j.at("species").get_to(s.species);
    j.at("level").get_to(s.level);
}

inline void to_json(nlohmann::json& j, const Party& p) {
    j = nlohmann::json{{"num_pokemon", p.num_pokemon}, {"pokemon", p.pokemon}};
}

inline void from_json(const nlohmann::json& j, Party& p) {
    j.at("num_pokemon").get_to(p.num_pokemon);
    j.at("pokemon").get_to(p.pokemon);
}

} // namespace pikelink::protocol
