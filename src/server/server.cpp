#include "server.hpp"
#include "relay_route.hpp"
#include "asio/error_code.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace pikelink::server {

using namespace pikelink::protocol;

Server::Server(asio::io_context& io_context, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(tcp::v4(), port))
    , port_(acceptor_.local_endpoint().port()) {
}

Server::~Server() {
    stop();
}

void Server::start() {
    running_ = true;
    accept();
    std::cout << "[Server] Relay started on port " << port_ << std::endl;
}

void Server::stop() {
    running_ = false;
    asio::error_code ec;
    acceptor_.close(ec);

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        session->close();
    }
    sessions_.clear();
}

size_t Server::session_count() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void Server::accept() {
    acceptor_.async_accept(
        [this](asio::error_code ec, tcp::socket socket) {
            if (!ec) {
                asio::error_code endpoint_ec;
                auto endpoint = socket.remote_endpoint(endpoint_ec);
                if (!endpoint_ec) {
                    std::cout << "[Server] New connection from " << endpoint.address().to_string() << std::endl;
                }
                auto session = std::make_shared<Session>(std::move(socket), *this);
                session->start();
            }

            if (running_) {
                accept();
            }
        });
}

void Server::on_client_connect(std::shared_ptr<Session> session) {
    PlayerId id = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        id = next_player_id_++;
    }
    session->set_player_id(id);

    // The handshake line must be the first thing the client reads
    session->send(encode_line(PlayerJoin{id}));

    // Existing players re-send their state so the newcomer can draw them
    broadcast_except(encode_line(PlayerJoin{id}), id);
    broadcast_except(encode_line(UpdateRequest{}), id);

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[id] = std::move(session);
    }

    std::cout << "[Server] Player " << id << " joined" << std::endl;
}

void Server::on_event(PlayerId sender, const NetworkEvent& event) {
    Delivery delivery = route(event, sender);

    switch (delivery.kind) {
        case Delivery::Kind::Drop:
            std::cout << "[Server] Dropping " << event_name(event) << " from player " << sender << std::endl;
            break;
        case Delivery::Kind::AllExcept:
            broadcast_except(encode_line(event), delivery.player);
            break;
        case Delivery::Kind::One:
            send_to(delivery.player, encode_line(event));
            break;
    }
}

void Server::on_player_disconnect(PlayerId player_id) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.erase(player_id) == 0) {
            return;
        }
    }

    std::cout << "[Server] Player " << player_id << " disconnected" << std::endl;
    broadcast_except(encode_line(PlayerQuit{player_id}), player_id);
}

void Server::broadcast_except(const std::string& line, PlayerId exclude_id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
        if (id != exclude_id && session->is_open()) {
            session->send(line);
        }
    }
}

void Server::send_to(PlayerId player_id, const std::string& line) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(player_id);
    if (it == sessions_.end() || !it->second->is_open()) {
        std::cout << "[Server] No open session for player " << player_id << std::endl;
        return;
    }
    it->second->send(line);
}

} // namespace pikelink::server
