#include "client_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace pikelink::client {

bool ClientConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ClientConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        host = j.value("host", host);
        port = j.value("port", port);
        rom_path = j.value("rom_path", rom_path);
        save_path = j.value("save_path", save_path);
        emulator_core = j.value("emulator_core", emulator_core);
        sprite_sheet = j.value("sprite_sheet", sprite_sheet);
        scale = j.value("scale", scale);
        chat_width = j.value("chat_width", chat_width);
        chat_history = j.value("chat_history", chat_history);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ClientConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace pikelink::client
