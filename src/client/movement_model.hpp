#pragma once

#include "protocol/player_data.hpp"
#include "engine/emulator.hpp"
#include <glm/glm.hpp>
#include <cstdint>

namespace pikelink::client::movement {

constexpr int TILE_SIZE = 16;

// Where the engine draws the local player on screen
inline const glm::ivec2 SCREEN_ANCHOR{engine::SCREEN_WIDTH / 2 - 16, engine::SCREEN_HEIGHT / 2 - 12};

// Tiles visible around the player in each direction
constexpr int VISIBLE_TILES_X = 6;
constexpr int VISIBLE_TILES_Y = 5;

struct FrameIndex {
    int index = 0;
    bool flip_horizontal = false;

    bool operator==(const FrameIndex&) const = default;
};

// Sub-tile offset while walking. The walk counter starts at 8 and counts down
// as the sprite moves 2 pixels per tick; map coordinates update when it hits 0.
glm::ivec2 draw_offset(protocol::Direction direction, uint8_t walk_counter);

FrameIndex frame_index(protocol::Direction direction, uint8_t walk_counter);

glm::ivec2 pixel_position(const protocol::PlayerData& player);

// Screen position of `other` when the camera follows `self`
glm::ivec2 relative_draw_position(const protocol::PlayerData& self, const protocol::PlayerData& other);

bool occupies(const protocol::PlayerData& player, uint8_t map_id, uint8_t x, uint8_t y);

bool is_visible_to(const protocol::PlayerData& self, const protocol::PlayerData& other);

} // namespace pikelink::client::movement
