#include "client/client_config.hpp"
#include "client/game.hpp"
#include "protocol/network_event.hpp"
#include <SDL3/SDL.h>
#include <asio.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <string>

// Custom SDL log function with timestamps
void SDLCALL log_with_timestamp(void* userdata, int category, SDL_LogPriority priority, const char* message) {
    (void)userdata;
    (void)category;

    // Get current time with milliseconds
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    const char* priority_str = "";
    switch (priority) {
        case SDL_LOG_PRIORITY_VERBOSE: priority_str = "VERBOSE"; break;
        case SDL_LOG_PRIORITY_DEBUG:   priority_str = "DEBUG"; break;
        case SDL_LOG_PRIORITY_INFO:    priority_str = "INFO"; break;
        case SDL_LOG_PRIORITY_WARN:    priority_str = "WARN"; break;
        case SDL_LOG_PRIORITY_ERROR:   priority_str = "ERROR"; break;
        case SDL_LOG_PRIORITY_CRITICAL: priority_str = "CRITICAL"; break;
        default: priority_str = "???"; break;
    }

    fprintf(stderr, "[%02d:%02d:%02d.%03d] [%s] %s\n",
            tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec,
            static_cast<int>(ms.count()),
            priority_str, message);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config <file>  Client config (default: data/client.json)" << std::endl;
    std::cout << "  -h, --host <host>    Relay host (default: localhost)" << std::endl;
    std::cout << "  -p, --port <port>    Relay port (default: 8080)" << std::endl;
    std::cout << "  -r, --rom <file>     Cartridge image" << std::endl;
    std::cout << "  --core <library>     Emulator core shared object" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = "data/client.json";
    std::string host, rom, core;
    int port = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if ((arg == "-r" || arg == "--rom") && i + 1 < argc) {
            rom = argv[++i];
        } else if (arg == "--core" && i + 1 < argc) {
            core = argv[++i];
        }
    }

    pikelink::client::ClientConfig config;
    if (!config.load(config_path)) {
        std::cerr << "Using default client settings" << std::endl;
    }
    if (!host.empty()) config.host = host;
    if (port > 0) config.port = static_cast<uint16_t>(port);
    if (!rom.empty()) config.rom_path = rom;
    if (!core.empty()) config.emulator_core = core;

    std::cout << "=== PikeLink Client ===" << std::endl;
    std::cout << "Relay: " << config.host << ":" << config.port << std::endl;
    std::cout << "ROM: " << config.rom_path << std::endl;
    std::cout << std::endl;
    std::cout << "Controls:" << std::endl;
    std::cout << "  Arrow Keys - D-pad" << std::endl;
    std::cout << "  Z / X - A / B" << std::endl;
    std::cout << "  Enter / Right Shift - Start / Select" << std::endl;
    std::cout << "  Space (hold) - Fast forward" << std::endl;
    std::cout << "  T - Chat (Enter sends, Esc cancels)" << std::endl;
    std::cout << std::endl;

    // Set up timestamped logging
    SDL_SetLogOutputFunction(log_with_timestamp, nullptr);

    pikelink::client::Game game(config);

    try {
        if (!game.init()) {
            std::cerr << "Failed to initialize game" << std::endl;
            return 1;
        }
    } catch (const pikelink::protocol::DecodeError& e) {
        std::cerr << "Handshake with " << config.host << ":" << config.port << " failed: " << e.what() << std::endl;
        return 1;
    } catch (const asio::system_error& e) {
        std::cerr << "Could not reach relay " << config.host << ":" << config.port << ": " << e.what() << std::endl;
        return 1;
    }

    game.run();
    game.shutdown();

    return 0;
}
