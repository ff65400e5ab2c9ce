#include <catch2/catch_test_macros.hpp>
#include "client/player_table.hpp"
#include <cstdint>
#include <vector>

using namespace pikelink::client;
using namespace pikelink::protocol;

namespace {

PlayerData make_player(PlayerId id, uint8_t x) {
    PlayerData p;
    p.id = id;
    p.name = {static_cast<uint8_t>(0x80 + id)};
    p.movement.map_x = x;
    return p;
}

} // namespace

TEST_CASE("PlayerTable upsert and lookup") {
    PlayerTable table;
    table.upsert(make_player(1, 3));
    table.upsert(make_player(2, 4));
    REQUIRE(table.size() == 2);

    auto p = table.find(1);
    REQUIRE(p.has_value());
    REQUIRE(p->movement.map_x == 3);

    table.upsert(make_player(1, 9));
    REQUIRE(table.size() == 2);
    REQUIRE(table.find(1)->movement.map_x == 9);

    REQUIRE_FALSE(table.find(3).has_value());
}

TEST_CASE("PlayerTable update_movement only touches existing entries") {
    PlayerTable table;
    table.upsert(make_player(1, 3));

    MovementData m{5, 6, 7, Direction::Right, 2};
    REQUIRE(table.update_movement(1, m));
    REQUIRE(table.find(1)->movement == m);
    REQUIRE(table.find(1)->name == std::vector<uint8_t>{0x81});

    REQUIRE_FALSE(table.update_movement(2, m));
    REQUIRE(table.size() == 1);
}

TEST_CASE("PlayerTable remove, find_if and clear") {
    PlayerTable table;
    table.upsert(make_player(1, 3));
    table.upsert(make_player(2, 4));

    auto hit = table.find_if([](const PlayerData& p) { return p.movement.map_x == 4; });
    REQUIRE(hit.has_value());
    REQUIRE(hit->id == 2);
    REQUIRE_FALSE(table.find_if([](const PlayerData& p) { return p.movement.map_x == 5; }).has_value());

    REQUIRE(table.remove(1));
    REQUIRE_FALSE(table.remove(1));
    REQUIRE(table.snapshot().size() == 1);

    table.clear();
    REQUIRE(table.size() == 0);
}
