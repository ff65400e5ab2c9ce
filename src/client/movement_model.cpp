#include "movement_model.hpp"
#include <cstdint>
#include <cstdlib>

namespace pikelink::client::movement {

using protocol::Direction;
using protocol::PlayerData;

glm::ivec2 draw_offset(Direction direction, uint8_t walk_counter) {
    if (walk_counter == 0) return {0, 0};
    int offset = (8 - static_cast<int>(walk_counter)) * 2;

    switch (direction) {
        case Direction::Down:  return {0, offset};
        case Direction::Up:    return {0, -offset};
        case Direction::Right: return {offset, 0};
        case Direction::Left:  return {-offset, 0};
    }
    return {0, 0};
}

FrameIndex frame_index(Direction direction, uint8_t walk_counter) {
    FrameIndex frame;
    switch (direction) {
        case Direction::Down:  frame = {0, false}; break;
        case Direction::Up:    frame = {1, false}; break;
        case Direction::Right: frame = {2, true}; break;
        case Direction::Left:  frame = {2, false}; break;
    }

    // Second half of the step shows the mid-stride frame
    if (walk_counter / 4 == 1) {
        frame.index += 3;
    }
    return frame;
}

glm::ivec2 pixel_position(const PlayerData& player) {
    const auto& m = player.movement;
    glm::ivec2 tile{m.map_x * TILE_SIZE, m.map_y * TILE_SIZE};
    return tile + draw_offset(m.direction, m.walk_counter);
}

glm::ivec2 relative_draw_position(const PlayerData& self, const PlayerData& other) {
    return pixel_position(other) - pixel_position(self) + SCREEN_ANCHOR;
}

bool occupies(const PlayerData& player, uint8_t map_id, uint8_t x, uint8_t y) {
    const auto& m = player.movement;
    return m.map_id == map_id && m.map_x == x && m.map_y == y;
}

bool is_visible_to(const PlayerData& self, const PlayerData& other) {
    if (self.movement.map_id != other.movement.map_id) return false;
    int dx = std::abs(static_cast<int>(other.movement.map_x) - static_cast<int>(self.movement.map_x));
    int dy = std::abs(static_cast<int>(other.movement.map_y) - static_cast<int>(self.movement.map_y));
    return dx <= VISIBLE_TILES_X && dy <= VISIBLE_TILES_Y;
}

} // namespace pikelink::client::movement
