#pragma once

#include <cstdint>
#include <string>

namespace pikelink::server {

struct ServerConfig {
    uint16_t port = 8080;

    // Missing keys keep their defaults. Returns false if the file could not be read or parsed.
    bool load(const std::string& path);
};

} // namespace pikelink::server
