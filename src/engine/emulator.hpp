#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace pikelink::engine {

constexpr int SCREEN_WIDTH = 160;
constexpr int SCREEN_HEIGHT = 144;

enum class Button : uint8_t {
    Up,
    Down,
    Left,
    Right,
    A,
    B,
    Start,
    Select,
};

/**
 * Narrow capability interface over the emulator core that runs the game.
 *
 * The core itself (CPU, memory map, PPU, save RAM) is an external component;
 * PikeLink only steps it, peeks/pokes memory and registers, and observes the
 * program counter through the step hook.
 */
class Emulator {
public:
    /** Called before every instruction with the core paused on the current PC. */
    using StepHook = std::function<void(Emulator&)>;

    virtual ~Emulator() = default;

    /** Load a cartridge image. Battery RAM is read from/written to save_path. */
    virtual bool load_cartridge(const std::vector<uint8_t>& rom, const std::string& save_path) = 0;

    /** Run until the next vertical blank. */
    virtual void step_one_frame() = 0;

    virtual uint8_t read_byte(uint16_t address) const = 0;
    virtual void write_byte(uint16_t address, uint8_t value) = 0;

    /** Overwrite a byte of the cartridge ROM itself (address in the 0x4000-0x7FFF window). */
    virtual void patch_rom(size_t bank, uint16_t address, uint8_t value) = 0;

    virtual uint16_t program_counter() const = 0;
    virtual void set_program_counter(uint16_t pc) = 0;
    virtual uint8_t accumulator() const = 0;
    virtual void set_accumulator(uint8_t value) = 0;

    virtual void set_step_hook(StepHook hook) = 0;

    virtual void set_button(Button button, bool pressed) = 0;

    /** True once per completed frame since the last call. */
    virtual bool poll_screen() = 0;

    /** SCREEN_WIDTH * SCREEN_HEIGHT pixels, ARGB8888. */
    virtual std::span<const uint32_t> framebuffer() const = 0;
};

} // namespace pikelink::engine
