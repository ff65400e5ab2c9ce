#include <catch2/catch_test_macros.hpp>
#include "client/network_client.hpp"
#include "protocol/text_codec.hpp"
#include "server/relay_route.hpp"
#include "server/server.hpp"
#include <asio.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace pikelink::protocol;
using pikelink::client::NetworkClient;
using pikelink::server::Delivery;
using pikelink::server::route;

TEST_CASE("relay routing") {
    SECTION("state and chat go to everyone else") {
        REQUIRE(route(FullUpdate{3, {}}, 3) == Delivery{Delivery::Kind::AllExcept, 3});
        REQUIRE(route(MovementUpdate{3, {}}, 3) == Delivery{Delivery::Kind::AllExcept, 3});
        REQUIRE(route(Chat{3, {0x80}}, 3) == Delivery{Delivery::Kind::AllExcept, 3});
        REQUIRE(route(UpdateRequest{}, 3) == Delivery{Delivery::Kind::AllExcept, 3});
    }

    SECTION("battle data goes only to its target") {
        REQUIRE(route(BattleDataRequest{7, 3}, 3) == Delivery{Delivery::Kind::One, 7});
        REQUIRE(route(BattleDataResponse{3, {}}, 7) == Delivery{Delivery::Kind::One, 3});
    }

    SECTION("clients cannot announce joins or quits") {
        REQUIRE(route(PlayerJoin{3}, 3).kind == Delivery::Kind::Drop);
        REQUIRE(route(PlayerQuit{4}, 3).kind == Delivery::Kind::Drop);
    }
}

namespace {

using EventPredicate = std::function<bool(const NetworkEvent&)>;

// Polls until an event matching `pred` arrives or two seconds pass
bool wait_for(NetworkClient& client, std::vector<NetworkEvent>& received, const EventPredicate& pred) {
    for (int i = 0; i < 200; ++i) {
        client.poll_messages([&](const NetworkEvent& event) { received.push_back(event); });
        if (std::any_of(received.begin(), received.end(), pred)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

template<typename T>
EventPredicate is() {
    return [](const NetworkEvent& e) { return std::holds_alternative<T>(e); };
}

// Polls until the client's inbound flow has stopped or two seconds pass
bool wait_for_inbound_closed(const NetworkClient& client) {
    for (int i = 0; i < 200; ++i) {
        if (!client.inbound_open()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

// Stands in for the relay on a single connection: writes `script`, optionally
// closes its send side, then reports the first line the client sends and
// holds the socket until the client hangs up.
class ScriptedRelay {
public:
    explicit ScriptedRelay(std::string script, bool close_send_side = false)
        : acceptor_(io_, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0))
        , received_(line_.get_future()) {
        thread_ = std::thread([this, script = std::move(script), close_send_side]() {
            serve(script, close_send_side);
        });
    }

    ~ScriptedRelay() {
        if (thread_.joinable()) thread_.join();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    // First line from the client, empty if the connection ended first
    std::string received_line() {
        if (received_.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            return {};
        }
        return received_.get();
    }

private:
    void serve(const std::string& script, bool close_send_side) {
        asio::ip::tcp::socket socket(io_);
        asio::error_code ec;
        acceptor_.accept(socket, ec);
        if (!ec) asio::write(socket, asio::buffer(script), ec);
        if (!ec && close_send_side) socket.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
        if (ec) {
            line_.set_value({});
            return;
        }

        std::string buffer;
        size_t length = asio::read_until(socket, asio::dynamic_buffer(buffer), '\n', ec);
        line_.set_value(ec ? std::string{} : buffer.substr(0, length));

        // Returns with eof once the client closes its end
        asio::read(socket, asio::dynamic_buffer(buffer), ec);
    }

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::promise<std::string> line_;
    std::future<std::string> received_;
    std::thread thread_;
};

} // namespace

TEST_CASE("clients exchange events through a live relay") {
    asio::io_context io;
    pikelink::server::Server server(io, 0);
    server.start();
    std::thread io_thread([&io]() { io.run(); });

    NetworkClient alice;
    NetworkClient bob;
    std::vector<NetworkEvent> alice_got;
    std::vector<NetworkEvent> bob_got;

    REQUIRE(alice.connect("127.0.0.1", server.port()) == 1);
    REQUIRE(bob.connect("127.0.0.1", server.port()) == 2);
    REQUIRE(alice.local_player_id() == 1);
    REQUIRE(bob.local_player_id() == 2);

    // The earlier client hears about the newcomer and is asked for its state
    REQUIRE(wait_for(alice, alice_got, [](const NetworkEvent& e) {
        const auto* join = std::get_if<PlayerJoin>(&e);
        return join && join->id == 2;
    }));
    REQUIRE(wait_for(alice, alice_got, is<UpdateRequest>()));

    bob.send(Chat{2, text::encode_to_vector("hi")});
    REQUIRE(wait_for(alice, alice_got, is<Chat>()));

    alice.send(BattleDataRequest{2, 1});
    REQUIRE(wait_for(bob, bob_got, is<BattleDataRequest>()));
    auto request = std::find_if(bob_got.begin(), bob_got.end(), is<BattleDataRequest>());
    REQUIRE(std::get<BattleDataRequest>(*request).requester == 1);

    // The sender never gets its own chat back
    REQUIRE_FALSE(std::any_of(bob_got.begin(), bob_got.end(), is<Chat>()));

    bob.disconnect();
    REQUIRE(wait_for(alice, alice_got, [](const NetworkEvent& e) {
        const auto* quit = std::get_if<PlayerQuit>(&e);
        return quit && quit->id == 2;
    }));

    alice.disconnect();
    io.stop();
    io_thread.join();
    server.stop();
}

TEST_CASE("relay session count follows joins and quits") {
    asio::io_context io;
    pikelink::server::Server server(io, 0);
    server.start();
    std::thread io_thread([&io]() { io.run(); });

    auto wait_for_count = [&server](size_t expected) {
        for (int i = 0; i < 200; ++i) {
            if (server.session_count() == expected) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    };

    REQUIRE(server.session_count() == 0);

    NetworkClient alice;
    NetworkClient bob;
    alice.connect("127.0.0.1", server.port());
    bob.connect("127.0.0.1", server.port());
    REQUIRE(wait_for_count(2));

    bob.disconnect();
    REQUIRE(wait_for_count(1));

    alice.disconnect();
    REQUIRE(wait_for_count(0));

    io.stop();
    io_thread.join();
    server.stop();
}

TEST_CASE("a bad handshake fails the connect") {
    SECTION("first event is not a join") {
        ScriptedRelay relay("{\"type\":\"UpdateRequest\"}\n");
        NetworkClient client;
        REQUIRE_THROWS_AS(client.connect("127.0.0.1", relay.port()), DecodeError);
        REQUIRE_FALSE(client.is_connected());
        REQUIRE_FALSE(client.inbound_open());
    }

    SECTION("first line is not JSON") {
        ScriptedRelay relay("garbage\n");
        NetworkClient client;
        REQUIRE_THROWS_AS(client.connect("127.0.0.1", relay.port()), DecodeError);
        REQUIRE_FALSE(client.is_connected());
    }
}

TEST_CASE("a broken inbound stream leaves sending intact") {
    std::string handshake = encode_line(PlayerJoin{1});

    SECTION("malformed line from the relay") {
        ScriptedRelay relay(handshake + "garbage\n");
        NetworkClient client;
        REQUIRE(client.connect("127.0.0.1", relay.port()) == 1);
        REQUIRE(wait_for_inbound_closed(client));
        REQUIRE(client.is_connected());

        client.send(Chat{1, text::encode_to_vector("still here")});
        NetworkEvent event = decode_line(relay.received_line());
        REQUIRE(std::holds_alternative<Chat>(event));
        REQUIRE(std::get<Chat>(event).message == text::encode_to_vector("still here"));

        client.disconnect();
    }

    SECTION("relay closes its send side") {
        ScriptedRelay relay(handshake, true);
        NetworkClient client;
        REQUIRE(client.connect("127.0.0.1", relay.port()) == 1);
        REQUIRE(wait_for_inbound_closed(client));

        client.send(UpdateRequest{});
        REQUIRE(std::holds_alternative<UpdateRequest>(decode_line(relay.received_line())));

        client.disconnect();
    }

    SECTION("queued events before the bad line are still delivered") {
        ScriptedRelay relay(handshake + encode_line(PlayerQuit{4}) + "{\"type\":\"Nope\"}\n");
        NetworkClient client;
        client.connect("127.0.0.1", relay.port());
        REQUIRE(wait_for_inbound_closed(client));

        std::vector<NetworkEvent> received;
        client.poll_messages([&](const NetworkEvent& e) { received.push_back(e); });
        REQUIRE(received.size() == 1);
        REQUIRE(std::get<PlayerQuit>(received[0]).id == 4);

        // Unblocks the relay's read so it can wind down
        client.send(UpdateRequest{});
        relay.received_line();
        client.disconnect();
    }
}

TEST_CASE("connecting to a closed port throws") {
    asio::io_context io;
    uint16_t port = 0;
    {
        // Bind and release to find a port nobody listens on
        asio::ip::tcp::acceptor listener(io, asio::ip::tcp::endpoint(asio::ip::tcp::v4(), 0));
        port = listener.local_endpoint().port();
    }

    NetworkClient client;
    REQUIRE_THROWS_AS(client.connect("127.0.0.1", port), asio::system_error);
    REQUIRE_FALSE(client.is_connected());
}
