#include "engine_state.hpp"
#include "offsets.hpp"
#include "protocol/text_codec.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace pikelink::client {

using namespace pikelink::protocol;

PlayerData extract_player_data(const engine::Emulator& emulator) {
    PlayerData data;

    for (size_t i = 0; i < offsets::PLAYER_NAME_LENGTH; ++i) {
        uint8_t b = emulator.read_byte(static_cast<uint16_t>(offsets::PLAYER_NAME + i));
        if (b == text::special::TERMINATOR) break;
        data.name.push_back(b);
    }

    auto& m = data.movement;
    m.map_id = emulator.read_byte(offsets::MAP_ID);
    m.map_x = emulator.read_byte(offsets::MAP_X);
    m.map_y = emulator.read_byte(offsets::MAP_Y);
    m.direction = static_cast<Direction>(emulator.read_byte(offsets::PLAYER_DIR));
    m.walk_counter = emulator.read_byte(offsets::WALK_COUNTER);
    return data;
}

Party extract_party(const engine::Emulator& emulator) {
    Party party;
    party.num_pokemon = static_cast<uint8_t>(
        std::min<size_t>(emulator.read_byte(offsets::PARTY_COUNT), kPartySize));

    for (uint8_t i = 0; i < party.num_pokemon; ++i) {
        auto& slot = party.pokemon[i];
        slot.species = emulator.read_byte(static_cast<uint16_t>(offsets::PARTY_SPECIES + i));
        slot.level = emulator.read_byte(static_cast<uint16_t>(
            offsets::PARTY_MONS + i * offsets::PARTY_MON_SIZE + offsets::PARTY_MON_LEVEL));
    }
    return party;
}

void load_party(engine::Emulator& emulator, const Party& party) {
    const size_t bank = offsets::PROF_OAK_DATA_BANK;
    uint16_t addr = offsets::PROF_OAK_DATA_ADDR;

    // 0xFF selects the per-pokemon level format
    emulator.patch_rom(bank, addr++, 0xFF);
    size_t count = std::min<size_t>(party.num_pokemon, kPartySize);
    for (size_t i = 0; i < count; ++i) {
        emulator.patch_rom(bank, addr++, party.pokemon[i].level);
        emulator.patch_rom(bank, addr++, party.pokemon[i].species);
    }
    emulator.patch_rom(bank, addr, 0x00);
}

void set_battle(engine::Emulator& emulator, const Party& party) {
    emulator.write_byte(offsets::BATTLE_TYPE, static_cast<uint8_t>(values::BattleType::Normal));
    emulator.write_byte(offsets::ACTIVE_BATTLE, static_cast<uint8_t>(values::ActiveBattle::Trainer));
    emulator.write_byte(offsets::TRAINER_NUM, 1);
    uint8_t opponent = values::TRAINER_TAG + static_cast<uint8_t>(values::TrainerClass::ProfOak);
    emulator.write_byte(offsets::CURRENT_OPPONENT, opponent);

    load_party(emulator, party);
}

} // namespace pikelink::client
