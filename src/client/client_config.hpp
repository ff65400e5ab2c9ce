#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pikelink::client {

struct ClientConfig {
    std::string host = "localhost";
    uint16_t port = 8080;

    std::string rom_path = "Pokemon Red.gb";
    std::string save_path = "Pokemon Red.sav";
    std::string emulator_core = "libgbcore.so";

    // Optional 6-frame, 16x16 horizontal strip used for remote players
    std::string sprite_sheet;

    int scale = 3;
    int chat_width = 250;
    size_t chat_history = 64;

    // Missing keys keep their defaults. Returns false if the file could not be read or parsed.
    bool load(const std::string& path);
};

} // namespace pikelink::client
