#pragma once

#include <cstddef>
#include <cstdint>

// Fixed addresses inside Pokemon Red (UE), taken from the pokered disassembly
// symbol table. Everything that depends on the program image lives here.
namespace pikelink::client::offsets {

// ========== Program counter checkpoints ==========

// OverworldLoop: top of the per-frame overworld routine
constexpr uint16_t OVERWORLD_LOOP_START = 0x03FF;

// IsSpriteInFrontOfPlayer exits: early exit when the map has no sprites,
// and the exit after scanning every sprite without a hit
constexpr uint16_t SPRITE_CHECK_EXIT_1 = 0x0B3F;
constexpr uint16_t SPRITE_CHECK_EXIT_2 = 0x0B9D;

// DisplayTextID, right after the text box has been initialised and
// after the message address has been resolved
constexpr uint16_t DISPLAY_TEXT_ID_AFTER_INIT = 0x2937;
constexpr uint16_t DISPLAY_TEXT_SETUP_DONE = 0x29A4;

// Single-byte loads of the next text byte: PlaceNextChar (ld a, [de])
// and NextTextCommand (ld a, [hli])
constexpr uint16_t TEXT_PROCESSOR_NEXT_CHAR_1 = 0x1956;
constexpr uint16_t TEXT_PROCESSOR_NEXT_CHAR_2 = 0x1B55;

// Final ret of TextCommandProcessor
constexpr uint16_t TEXT_PROCESSOR_END = 0x1B5F;

// ========== Overworld state ==========

constexpr uint16_t PLAYER_NAME = 0xD158;
constexpr size_t PLAYER_NAME_LENGTH = 11;

constexpr uint16_t MAP_ID = 0xD35E;
constexpr uint16_t MAP_Y = 0xD361;
constexpr uint16_t MAP_X = 0xD362;
constexpr uint16_t PLAYER_DIR = 0xC109;    // Facing byte of sprite slot 0
constexpr uint16_t WALK_COUNTER = 0xCFC5;
constexpr uint16_t NUM_SPRITES = 0xD4E1;

constexpr uint16_t SPRITE_INDEX = 0xFF8C;  // hSpriteIndexOrTextID
constexpr uint16_t FRAME_COUNTER = 0xFFD5; // Text delay frames

// ========== Party ==========

constexpr uint16_t PARTY_COUNT = 0xD163;
constexpr uint16_t PARTY_SPECIES = 0xD164;
constexpr uint16_t PARTY_MONS = 0xD16B;
constexpr uint16_t PARTY_MON_SIZE = 0x2C;
constexpr uint16_t PARTY_MON_LEVEL = 0x21;  // Offset of the level byte inside a party struct

// ========== Battle setup ==========

constexpr uint16_t ACTIVE_BATTLE = 0xD057;
constexpr uint16_t CURRENT_OPPONENT = 0xD059;
constexpr uint16_t BATTLE_TYPE = 0xD05A;
constexpr uint16_t TRAINER_NUM = 0xD05D;

// Prof. Oak's trainer party, reused as the remote player's party
constexpr size_t PROF_OAK_DATA_BANK = 0x0E;
constexpr uint16_t PROF_OAK_DATA_ADDR = 0x621D;

} // namespace pikelink::client::offsets

namespace pikelink::client::values {

enum class BattleType : uint8_t {
    Normal = 0,
    OldMan = 1,
    Safari = 2,
};

enum class ActiveBattle : uint8_t {
    None = 0,
    Wild = 1,
    Trainer = 2,
};

enum class TrainerClass : uint8_t {
    Rival1 = 0x19,
    ProfOak = 0x1A,
};

// Opponent ids at or above this value are trainer classes
constexpr uint8_t TRAINER_TAG = 200;

constexpr uint8_t TEXT_DELAY_FRAMES = 30;
constexpr uint8_t SPRITE_INDEX_BLOCKED = 0xFF;

} // namespace pikelink::client::values
