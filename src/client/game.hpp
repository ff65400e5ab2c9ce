#pragma once

#include "client_config.hpp"
#include "network_client.hpp"
#include "renderer.hpp"
#include "session_driver.hpp"
#include "engine/application.hpp"
#include "engine/emulator_loader.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pikelink::client {

class Game : public engine::Application {
public:
    explicit Game(ClientConfig config);
    ~Game();

    // Loads the core and cartridge, joins the relay and opens the window.
    // Connection and handshake errors propagate as exceptions.
    bool init();
    void shutdown();

protected:
    bool on_init() override;
    void on_shutdown() override;
    void on_update(uint64_t now_ns) override;
    void on_render() override;

private:
    bool load_cartridge();
    void apply_input();

    ClientConfig config_;
    engine::EmulatorLibrary core_;
    NetworkClient network_;
    std::unique_ptr<SessionDriver> driver_;
    Renderer renderer_;
    bool initialized_ = false;
};

} // namespace pikelink::client
