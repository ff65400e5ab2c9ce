#pragma once

#include "protocol/network_event.hpp"
#include "session.hpp"
#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pikelink::server {

// Relay: assigns player ids and forwards events between connected clients.
// It keeps no game state of its own.
class Server {
public:
    using tcp = asio::ip::tcp;

    // Port 0 binds an ephemeral port; see port()
    Server(asio::io_context& io_context, uint16_t port);
    ~Server();

    void start();
    void stop();

    uint16_t port() const { return port_; }
    size_t session_count();

    void on_client_connect(std::shared_ptr<Session> session);
    void on_event(protocol::PlayerId sender, const protocol::NetworkEvent& event);
    void on_player_disconnect(protocol::PlayerId player_id);

    void broadcast_except(const std::string& line, protocol::PlayerId exclude_id);
    void send_to(protocol::PlayerId player_id, const std::string& line);

private:
    void accept();

    tcp::acceptor acceptor_;
    uint16_t port_ = 0;

    std::unordered_map<protocol::PlayerId, std::shared_ptr<Session>> sessions_;
    std::mutex sessions_mutex_;
    protocol::PlayerId next_player_id_ = 1;

    std::atomic<bool> running_{false};
};

} // namespace pikelink::server
