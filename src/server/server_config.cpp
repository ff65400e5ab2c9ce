#include "server_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace pikelink::server {

bool ServerConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[ServerConfig] Failed to open " << path << std::endl;
        return false;
    }
    try {
        json j = json::parse(f);
        port = j.value("port", port);
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ServerConfig] Error parsing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace pikelink::server
