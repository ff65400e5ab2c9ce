#include "server/server.hpp"
#include "server/server_config.hpp"
#include <asio.hpp>
#include <csignal>
#include <exception>
#include <functional>
#include <iostream>
#include <string>

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    pikelink::server::ServerConfig config;

    // Check for data dir relative to executable or current directory
    if (!config.load("data/server.json") && !config.load("../data/server.json")) {
        std::cerr << "Using default server settings" << std::endl;
    }

    uint16_t port = config.port;

    if (argc > 1) {
        try {
            port = static_cast<uint16_t>(std::stoi(argv[1]));
        } catch (const std::exception&) {
            std::cerr << "Usage: " << argv[0] << " [port]" << std::endl;
            return 1;
        }
    }

    try {
        asio::io_context io_context;

        pikelink::server::Server server(io_context, port);

        shutdown_handler = [&]() {
            server.stop();
            io_context.stop();
        };

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.start();

        std::cout << "PikeLink relay running on port " << server.port() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
