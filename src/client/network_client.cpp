#include "network_client.hpp"
#include "protocol/network_event.hpp"
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>

namespace pikelink::client {

using namespace pikelink::protocol;

NetworkClient::NetworkClient()
    : socket_(io_context_) {
}

NetworkClient::~NetworkClient() {
    disconnect();
}

PlayerId NetworkClient::connect(const std::string& host, uint16_t port) {
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port));
    asio::connect(socket_, endpoints);

    // The relay's first line assigns our identity
    try {
        size_t length = asio::read_until(socket_, asio::dynamic_buffer(read_buffer_), '\n');
        local_player_id_ = decode_handshake(take_line(length));
    } catch (const std::exception&) {
        asio::error_code ec;
        socket_.close(ec);
        throw;
    }

    connected_ = true;
    inbound_open_ = true;

    // Start IO thread
    work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_context_.get_executor());
    io_thread_ = std::thread(&NetworkClient::io_thread_func, this);

    asio::post(io_context_, [this]() { read_line(); });

    std::cout << "[NetworkClient] Connected to " << host << ":" << port
              << " as player " << local_player_id_ << std::endl;
    return local_player_id_;
}

void NetworkClient::disconnect() {
    if (!connected_) return;

    connected_ = false;

    asio::post(io_context_, [this]() {
        asio::error_code ec;
        socket_.close(ec);
    });
    work_.reset();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    std::cout << "[NetworkClient] Disconnected from server" << std::endl;
}

void NetworkClient::send(const NetworkEvent& event) {
    if (!connected_) return;

    std::string line = encode_line(event);
    asio::post(io_context_, [this, line = std::move(line)]() mutable {
        write_queue_.push(std::move(line));
        if (!writing_) {
            writing_ = true;
            do_write();
        }
    });
}

void NetworkClient::poll_messages(const EventCallback& callback) {
    std::queue<NetworkEvent> messages;
    {
        std::lock_guard<std::mutex> lock(message_mutex_);
        std::swap(messages, message_queue_);
    }

    while (!messages.empty()) {
        if (callback) {
            callback(messages.front());
        }
        messages.pop();
    }
}

void NetworkClient::io_thread_func() {
    try {
        io_context_.run();
    } catch (const std::exception& e) {
        std::cerr << "[NetworkClient] IO thread error: " << e.what() << std::endl;
    }
}

std::string NetworkClient::take_line(size_t length) {
    std::string line = read_buffer_.substr(0, length);
    read_buffer_.erase(0, length);
    return line;
}

void NetworkClient::read_line() {
    asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_), '\n',
        [this](asio::error_code ec, std::size_t length) {
            if (ec) {
                // Only the inbound flow stops; sends keep being attempted
                if (connected_) {
                    std::cerr << "[NetworkClient] Disconnected from server: " << ec.message() << std::endl;
                }
                inbound_open_ = false;
                return;
            }

            try {
                NetworkEvent event = decode_line(take_line(length));
                std::lock_guard<std::mutex> lock(message_mutex_);
                message_queue_.push(std::move(event));
            } catch (const DecodeError& e) {
                std::cerr << "[NetworkClient] Dropping inbound stream: " << e.what() << std::endl;
                inbound_open_ = false;
                return;
            }

            read_line();
        });
}

void NetworkClient::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    auto& front = write_queue_.front();
    asio::async_write(socket_,
        asio::buffer(front),
        [this](asio::error_code ec, std::size_t /*length*/) {
            if (ec) {
                // Best effort: the event is lost, later events are still tried
                std::cerr << "[NetworkClient] Write error: " << ec.message() << std::endl;
            }
            write_queue_.pop();
            do_write();
        });
}

} // namespace pikelink::client
