#pragma once

#include "protocol/network_event.hpp"
#include <asio.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace pikelink::server {

class Server;

// One connected client. Reads newline-delimited events and hands them to
// the server; queued writes go out one at a time.
class Session : public std::enable_shared_from_this<Session> {
public:
    using tcp = asio::ip::tcp;

    Session(tcp::socket socket, Server& server);

    void start();
    void send(const std::string& line);
    void close();

    void set_player_id(protocol::PlayerId id) { player_id_ = id; }

    bool is_open() const { return socket_.is_open(); }

private:
    void read_line();
    void do_write();

    tcp::socket socket_;
    Server& server_;
    protocol::PlayerId player_id_ = 0;
    bool departed_ = false;

    // Read buffer (may hold the start of the next line)
    std::string read_buffer_;

    // Write queue
    std::deque<std::string> write_queue_;
    bool writing_ = false;
    std::mutex write_mutex_;
};

} // namespace pikelink::server
