#pragma once

#include "protocol/player_data.hpp"
#include "engine/emulator.hpp"

namespace pikelink::client {

// Local player as currently stored in engine memory (id is left at 0)
protocol::PlayerData extract_player_data(const engine::Emulator& emulator);

protocol::Party extract_party(const engine::Emulator& emulator);

// Writes `party` over Prof. Oak's trainer data in ROM:
//   0xFF, (level, species) * num_pokemon, 0x00
void load_party(engine::Emulator& emulator, const protocol::Party& party);

// Start a trainer battle against `party` the next time the overworld runs.
// The opponent's party is loaded from the patched trainer data, so more
// detailed setup (moves, DVs) is not possible this way.
void set_battle(engine::Emulator& emulator, const protocol::Party& party);

} // namespace pikelink::client
