#pragma once

#include "game_state.hpp"
#include "player_table.hpp"
#include "engine/emulator.hpp"
#include <string_view>

namespace pikelink::client {

/**
 * Checkpoint handlers run before every emulated instruction.
 *
 * Sprite interception
 *   Normal -> Hacked : a sprite-check exit is reached while a remote player
 *                      stands on the tile the local player faces. The engine's
 *                      sprite index is forced to 0xFF ("something is in the way").
 *   any    -> Normal : OVERWORLD_LOOP_START, every overworld frame.
 *
 * Text interception (only entered while sprite interception is Hacked)
 *   Normal -> Hacked : DISPLAY_TEXT_ID_AFTER_INIT. Message lookup is skipped,
 *                      a synthetic message is queued and a battle is requested.
 *   Hacked           : each next-char checkpoint feeds one queued byte into A.
 *   any    -> Normal : TEXT_PROCESSOR_END.
 *
 * No handler blocks; everything happens inside a single emulator step.
 */
class HookStateMachine {
public:
    HookStateMachine(GameData& game_data, const PlayerTable& players);

    void on_step(engine::Emulator& emulator);

    void sprite_check_hook(engine::Emulator& emulator);
    void display_text_hook(engine::Emulator& emulator);

    // Queue a framed message box for the text processor to read
    void create_message_box(std::string_view text);

private:
    GameData& game_data_;
    const PlayerTable& players_;
};

} // namespace pikelink::client
