#pragma once

#include "connection.hpp"
#include "protocol/network_event.hpp"
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace pikelink::client {

// TCP link to the relay. Reads and writes run on a private io thread;
// decoded events wait in a queue until the driver calls poll_messages().
class NetworkClient : public Connection {
public:
    using tcp = asio::ip::tcp;

    NetworkClient();
    ~NetworkClient() override;

    // Connects and performs the PlayerJoin handshake. Throws asio::system_error
    // on connection failure and protocol::DecodeError on a bad handshake.
    protocol::PlayerId connect(const std::string& host, uint16_t port);
    void disconnect();

    bool is_connected() const { return connected_; }
    bool inbound_open() const { return inbound_open_; }

    void send(const protocol::NetworkEvent& event) override;
    void poll_messages(const EventCallback& callback) override;
    protocol::PlayerId local_player_id() const override { return local_player_id_; }

private:
    void io_thread_func();
    void read_line();
    std::string take_line(size_t length);
    void do_write();

    asio::io_context io_context_;
    tcp::socket socket_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> inbound_open_{false};
    protocol::PlayerId local_player_id_ = 0;

    // Read buffer (may hold the start of the next line)
    std::string read_buffer_;

    // Write queue, only touched on the io thread
    std::queue<std::string> write_queue_;
    bool writing_ = false;

    // Decoded events for the main thread
    std::queue<protocol::NetworkEvent> message_queue_;
    std::mutex message_mutex_;
};

} // namespace pikelink::client
