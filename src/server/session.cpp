#include "session.hpp"
#include "asio/buffer.hpp"
#include "asio/error_code.hpp"
#include "asio/read_until.hpp"
#include "asio/write.hpp"
#include "protocol/network_event.hpp"
#include "server.hpp"
#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

namespace pikelink::server {

using namespace pikelink::protocol;

Session::Session(tcp::socket socket, Server& server)
    : socket_(std::move(socket))
    , server_(server) {
}

void Session::start() {
    server_.on_client_connect(shared_from_this());
    read_line();
}

void Session::send(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_queue_.push_back(line);
    if (!writing_) {
        writing_ = true;
        do_write();
    }
}

void Session::close() {
    asio::error_code ec;
    socket_.close(ec);
}

void Session::read_line() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, asio::dynamic_buffer(read_buffer_), '\n',
        [this, self](asio::error_code ec, std::size_t length) {
            if (ec) {
                if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                    std::cout << "[Session] Player " << player_id_ << " read error: " << ec.message() << std::endl;
                }
                close();
                if (!departed_) {
                    departed_ = true;
                    server_.on_player_disconnect(player_id_);
                }
                return;
            }

            std::string line = read_buffer_.substr(0, length);
            read_buffer_.erase(0, length);

            try {
                server_.on_event(player_id_, decode_line(line));
            } catch (const DecodeError& e) {
                // Framing is intact, so skip the line and keep reading
                std::cout << "[Session] Player " << player_id_ << " sent a bad line: " << e.what() << std::endl;
            }

            read_line();
        });
}

void Session::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        return;
    }

    auto self = shared_from_this();
    auto& front = write_queue_.front();
    asio::async_write(socket_,
        asio::buffer(front),
        [this, self](asio::error_code ec, std::size_t /*length*/) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            if (!ec) {
                write_queue_.pop_front();
                if (!write_queue_.empty()) {
                    do_write();
                } else {
                    writing_ = false;
                }
            } else {
                std::cout << "[Session] Player " << player_id_ << " write error: " << ec.message() << std::endl;
                write_queue_.clear();
                writing_ = false;
                close();
            }
        });
}

} // namespace pikelink::server
