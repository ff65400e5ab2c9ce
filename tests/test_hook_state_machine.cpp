#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "client/hook_state_machine.hpp"
#include "client/offsets.hpp"
#include "protocol/text_codec.hpp"
#include <cstdint>
#include <vector>

using namespace pikelink::client;
using namespace pikelink::protocol;
using pikelink::testing::FakeEmulator;

namespace {

PlayerData peer_at(PlayerId id, uint8_t map_id, uint8_t x, uint8_t y) {
    PlayerData p;
    p.id = id;
    p.movement = MovementData{map_id, x, y, Direction::Down, 0};
    return p;
}

void place_local(FakeEmulator& emu, uint8_t map_id, uint8_t x, uint8_t y, Direction dir) {
    emu.memory[offsets::MAP_ID] = map_id;
    emu.memory[offsets::MAP_X] = x;
    emu.memory[offsets::MAP_Y] = y;
    emu.memory[offsets::PLAYER_DIR] = static_cast<uint8_t>(dir);
}

struct HookFixture {
    FakeEmulator emu;
    PlayerTable players;
    GameData game_data;
    HookStateMachine hooks{game_data, players};

    HookFixture() {
        emu.set_step_hook([this](pikelink::engine::Emulator& e) { hooks.on_step(e); });
    }
};

} // namespace

TEST_CASE("sprite interception") {
    HookFixture f;
    place_local(f.emu, 1, 5, 5, Direction::Down);
    f.players.upsert(peer_at(7, 1, 5, 6));

    SECTION("second exit with a peer in front goes Hacked") {
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_2);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Hacked);
        REQUIRE(f.game_data.interception.last_interaction == 7);
        REQUIRE(f.emu.memory[offsets::SPRITE_INDEX] == 0xFF);

        f.emu.step_at(offsets::OVERWORLD_LOOP_START);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Normal);
    }

    SECTION("first exit only counts when the map has no sprites") {
        f.emu.memory[offsets::NUM_SPRITES] = 3;
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_1);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Normal);
        REQUIRE(f.emu.memory[offsets::SPRITE_INDEX] == 0x00);

        f.emu.memory[offsets::NUM_SPRITES] = 0;
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_1);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Hacked);
        REQUIRE(f.game_data.interception.last_interaction == 7);
    }

    SECTION("peer on another map does not block") {
        f.players.upsert(peer_at(7, 2, 5, 6));
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_2);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Normal);
    }

    SECTION("peer beside the player does not block") {
        place_local(f.emu, 1, 5, 5, Direction::Right);
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_2);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Normal);
    }

    SECTION("other checkpoints are ignored") {
        f.emu.step_at(0x1234);
        REQUIRE(f.game_data.interception.sprite_state == DataState::Normal);
        REQUIRE(f.emu.memory[offsets::SPRITE_INDEX] == 0x00);
    }
}

TEST_CASE("faced tile follows each direction") {
    HookFixture f;

    SECTION("up") {
        place_local(f.emu, 1, 5, 5, Direction::Up);
        f.players.upsert(peer_at(3, 1, 5, 4));
    }
    SECTION("left") {
        place_local(f.emu, 1, 5, 5, Direction::Left);
        f.players.upsert(peer_at(3, 1, 4, 5));
    }
    SECTION("right") {
        place_local(f.emu, 1, 5, 5, Direction::Right);
        f.players.upsert(peer_at(3, 1, 6, 5));
    }
    SECTION("left from column zero wraps like the engine") {
        place_local(f.emu, 1, 0, 5, Direction::Left);
        f.players.upsert(peer_at(3, 1, 255, 5));
    }

    f.emu.step_at(offsets::SPRITE_CHECK_EXIT_2);
    REQUIRE(f.game_data.interception.sprite_state == DataState::Hacked);
    REQUIRE(f.game_data.interception.last_interaction == 3);
}

TEST_CASE("text interception") {
    HookFixture f;

    SECTION("dialogue init without sprite interception runs normally") {
        f.emu.step_at(offsets::DISPLAY_TEXT_ID_AFTER_INIT);
        REQUIRE(f.emu.program_counter() == offsets::DISPLAY_TEXT_ID_AFTER_INIT);
        REQUIRE(f.game_data.interception.text_state == DataState::Normal);
        REQUIRE(f.game_data.phase == SessionPhase::Normal);
    }

    SECTION("next-char checkpoints leave A alone while Normal") {
        f.emu.set_accumulator(0x42);
        f.emu.step_at(offsets::TEXT_PROCESSOR_NEXT_CHAR_1);
        REQUIRE(f.emu.accumulator() == 0x42);
        REQUIRE(f.emu.program_counter() == offsets::TEXT_PROCESSOR_NEXT_CHAR_1);
    }

    SECTION("synthetic message replaces the engine's text") {
        place_local(f.emu, 1, 5, 5, Direction::Down);
        f.players.upsert(peer_at(7, 1, 5, 6));
        f.emu.step_at(offsets::SPRITE_CHECK_EXIT_2);

        f.emu.step_at(offsets::DISPLAY_TEXT_ID_AFTER_INIT);
        REQUIRE(f.emu.program_counter() == offsets::DISPLAY_TEXT_SETUP_DONE);
        REQUIRE(f.emu.memory[offsets::FRAME_COUNTER] == 30);
        REQUIRE(f.game_data.interception.text_state == DataState::Hacked);
        REQUIRE(f.game_data.network_request == NetworkRequest::battle(7));
        REQUIRE(f.game_data.phase == SessionPhase::Waiting);

        auto expected = text::message_box("PLAYER has nothing\nto say.");
        std::vector<uint8_t> fed;
        for (size_t i = 0; i < expected.size(); ++i) {
            uint16_t checkpoint = (i % 2 == 0) ? offsets::TEXT_PROCESSOR_NEXT_CHAR_1
                                               : offsets::TEXT_PROCESSOR_NEXT_CHAR_2;
            f.emu.step_at(checkpoint);
            REQUIRE(f.emu.program_counter() == checkpoint + 1);
            fed.push_back(f.emu.accumulator());
        }
        REQUIRE(fed == expected);
        REQUIRE(f.game_data.interception.pending_message.empty());

        // Queue drained: the processor keeps reading terminators
        f.emu.step_at(offsets::TEXT_PROCESSOR_NEXT_CHAR_2);
        REQUIRE(f.emu.accumulator() == text::special::TERMINATOR);

        f.emu.step_at(offsets::TEXT_PROCESSOR_END);
        REQUIRE(f.game_data.interception.text_state == DataState::Normal);

        // Sprite interception is independent and still Hacked until the overworld loop
        REQUIRE(f.game_data.interception.sprite_state == DataState::Hacked);
        f.emu.set_accumulator(0x11);
        f.emu.step_at(offsets::TEXT_PROCESSOR_NEXT_CHAR_1);
        REQUIRE(f.emu.accumulator() == 0x11);
    }
}

TEST_CASE("create_message_box appends framed text") {
    GameData game_data;
    PlayerTable players;
    HookStateMachine hooks(game_data, players);

    hooks.create_message_box("HI");
    const auto& queue = game_data.interception.pending_message;
    std::vector<uint8_t> bytes(queue.begin(), queue.end());
    REQUIRE(bytes == std::vector<uint8_t>{
        text::special::TEXT_START, 0x87, 0x88, text::special::END_MSG, text::special::TERMINATOR});
}
