#include <catch2/catch_test_macros.hpp>
#include "client/movement_model.hpp"
#include <cstdint>
#include <cstdlib>

using namespace pikelink::client;
using namespace pikelink::protocol;

namespace {

PlayerData player_at(uint8_t map_id, uint8_t x, uint8_t y,
                     Direction dir = Direction::Down, uint8_t walk_counter = 0) {
    PlayerData p;
    p.movement = MovementData{map_id, x, y, dir, walk_counter};
    return p;
}

} // namespace

TEST_CASE("draw_offset moves along exactly one axis") {
    const Direction directions[] = {Direction::Down, Direction::Up, Direction::Left, Direction::Right};

    for (Direction dir : directions) {
        for (int w = 0; w <= 8; ++w) {
            auto offset = movement::draw_offset(dir, static_cast<uint8_t>(w));
            int magnitude = (8 - w) * 2;
            if (w == 0) magnitude = 0;

            bool vertical = dir == Direction::Down || dir == Direction::Up;
            if (vertical) {
                REQUIRE(offset.x == 0);
                REQUIRE(std::abs(offset.y) == magnitude);
            } else {
                REQUIRE(offset.y == 0);
                REQUIRE(std::abs(offset.x) == magnitude);
            }
        }
    }
}

TEST_CASE("draw_offset signs follow the facing direction") {
    REQUIRE(movement::draw_offset(Direction::Down, 6) == glm::ivec2(0, 4));
    REQUIRE(movement::draw_offset(Direction::Up, 6) == glm::ivec2(0, -4));
    REQUIRE(movement::draw_offset(Direction::Right, 1) == glm::ivec2(14, 0));
    REQUIRE(movement::draw_offset(Direction::Left, 1) == glm::ivec2(-14, 0));
    REQUIRE(movement::draw_offset(Direction::Left, 0) == glm::ivec2(0, 0));
}

TEST_CASE("frame_index") {
    SECTION("standing frames") {
        REQUIRE(movement::frame_index(Direction::Down, 0) == movement::FrameIndex{0, false});
        REQUIRE(movement::frame_index(Direction::Up, 0) == movement::FrameIndex{1, false});
        REQUIRE(movement::frame_index(Direction::Right, 0) == movement::FrameIndex{2, true});
        REQUIRE(movement::frame_index(Direction::Left, 0) == movement::FrameIndex{2, false});
    }

    SECTION("mid-stride frames while walk counter is 4 to 7") {
        for (uint8_t w = 4; w < 8; ++w) {
            REQUIRE(movement::frame_index(Direction::Down, w).index == 3);
            REQUIRE(movement::frame_index(Direction::Up, w).index == 4);
            REQUIRE(movement::frame_index(Direction::Left, w) == movement::FrameIndex{5, false});
            REQUIRE(movement::frame_index(Direction::Right, w) == movement::FrameIndex{5, true});
        }
        REQUIRE(movement::frame_index(Direction::Down, 8).index == 0);
        REQUIRE(movement::frame_index(Direction::Down, 3).index == 0);
    }

    SECTION("left and right differ only in flip") {
        for (uint8_t w = 0; w <= 8; ++w) {
            auto left = movement::frame_index(Direction::Left, w);
            auto right = movement::frame_index(Direction::Right, w);
            REQUIRE(left.index == right.index);
            REQUIRE(left.flip_horizontal != right.flip_horizontal);
            REQUIRE(movement::frame_index(Direction::Left, w) == left);
        }
    }
}

TEST_CASE("relative_draw_position anchors the local player") {
    auto self = player_at(1, 10, 10);

    SECTION("same tile draws at the anchor") {
        REQUIRE(movement::relative_draw_position(self, self) == movement::SCREEN_ANCHOR);
    }

    SECTION("one tile right and two up") {
        auto other = player_at(1, 11, 8);
        auto expected = movement::SCREEN_ANCHOR + glm::ivec2(16, -32);
        REQUIRE(movement::relative_draw_position(self, other) == expected);
    }

    SECTION("walking peer is offset toward its destination") {
        auto other = player_at(1, 10, 11, Direction::Down, 4);
        auto expected = movement::SCREEN_ANCHOR + glm::ivec2(0, 16 + 8);
        REQUIRE(movement::relative_draw_position(self, other) == expected);
    }
}

TEST_CASE("occupies and visibility") {
    auto p = player_at(3, 5, 7);

    REQUIRE(movement::occupies(p, 3, 5, 7));
    REQUIRE_FALSE(movement::occupies(p, 4, 5, 7));
    REQUIRE_FALSE(movement::occupies(p, 3, 6, 7));
    REQUIRE_FALSE(movement::occupies(p, 3, 5, 8));

    auto self = player_at(3, 10, 10);
    REQUIRE(movement::is_visible_to(self, player_at(3, 16, 15)));
    REQUIRE(movement::is_visible_to(self, player_at(3, 4, 5)));
    REQUIRE_FALSE(movement::is_visible_to(self, player_at(3, 17, 10)));
    REQUIRE_FALSE(movement::is_visible_to(self, player_at(3, 10, 16)));
    REQUIRE_FALSE(movement::is_visible_to(self, player_at(2, 10, 10)));
}
