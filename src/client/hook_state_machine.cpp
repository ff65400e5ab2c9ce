#include "hook_state_machine.hpp"
#include "offsets.hpp"
#include "movement_model.hpp"
#include "protocol/text_codec.hpp"
#include <cstdint>

namespace pikelink::client {

using namespace pikelink::protocol;

namespace {

constexpr std::string_view kInteractionMessage = "PLAYER has nothing\nto say.";

} // namespace

HookStateMachine::HookStateMachine(GameData& game_data, const PlayerTable& players)
    : game_data_(game_data)
    , players_(players) {
}

void HookStateMachine::on_step(engine::Emulator& emulator) {
    sprite_check_hook(emulator);
    display_text_hook(emulator);
}

void HookStateMachine::sprite_check_hook(engine::Emulator& emulator) {
    auto& state = game_data_.interception;
    uint16_t pc = emulator.program_counter();

    if (pc == offsets::OVERWORLD_LOOP_START) {
        state.sprite_state = DataState::Normal;
    }

    bool at_exit_1 = pc == offsets::SPRITE_CHECK_EXIT_1 && emulator.read_byte(offsets::NUM_SPRITES) == 0;
    bool at_exit_2 = pc == offsets::SPRITE_CHECK_EXIT_2;
    if (!at_exit_1 && !at_exit_2) return;

    uint8_t map_id = emulator.read_byte(offsets::MAP_ID);

    // Tile the local player is trying to move into (byte arithmetic wraps like the engine's)
    uint8_t x = emulator.read_byte(offsets::MAP_X);
    uint8_t y = emulator.read_byte(offsets::MAP_Y);
    switch (static_cast<Direction>(emulator.read_byte(offsets::PLAYER_DIR))) {
        case Direction::Down:  ++y; break;
        case Direction::Up:    --y; break;
        case Direction::Right: ++x; break;
        default:               --x; break;
    }

    auto blocker = players_.find_if([&](const PlayerData& player) {
        return movement::occupies(player, map_id, x, y);
    });
    if (!blocker) return;

    emulator.write_byte(offsets::SPRITE_INDEX, values::SPRITE_INDEX_BLOCKED);
    state.sprite_state = DataState::Hacked;
    state.last_interaction = blocker->id;
}

void HookStateMachine::display_text_hook(engine::Emulator& emulator) {
    auto& state = game_data_.interception;

    if (state.sprite_state == DataState::Hacked &&
        emulator.program_counter() == offsets::DISPLAY_TEXT_ID_AFTER_INIT) {
        // Skip the message address lookup; the frame delay is normally set inside the skipped code
        emulator.set_program_counter(offsets::DISPLAY_TEXT_SETUP_DONE);
        emulator.write_byte(offsets::FRAME_COUNTER, values::TEXT_DELAY_FRAMES);

        state.text_state = DataState::Hacked;
        create_message_box(kInteractionMessage);

        game_data_.network_request = NetworkRequest::battle(state.last_interaction);
        game_data_.phase = SessionPhase::Waiting;
    }

    uint16_t pc = emulator.program_counter();
    if (state.text_state == DataState::Hacked &&
        (pc == offsets::TEXT_PROCESSOR_NEXT_CHAR_1 || pc == offsets::TEXT_PROCESSOR_NEXT_CHAR_2)) {
        uint8_t next = text::special::TERMINATOR;
        if (!state.pending_message.empty()) {
            next = state.pending_message.front();
            state.pending_message.pop_front();
        }
        // Both checkpoints sit on one-byte loads into A
        emulator.set_accumulator(next);
        emulator.set_program_counter(static_cast<uint16_t>(pc + 1));
    }

    if (emulator.program_counter() == offsets::TEXT_PROCESSOR_END) {
        state.text_state = DataState::Normal;
    }
}

void HookStateMachine::create_message_box(std::string_view message) {
    for (uint8_t b : text::message_box(message)) {
        game_data_.interception.pending_message.push_back(b);
    }
}

} // namespace pikelink::client
