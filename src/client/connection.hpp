#pragma once

#include "protocol/network_event.hpp"
#include <functional>

namespace pikelink::client {

// Link to the relay as seen by the session driver
class Connection {
public:
    using EventCallback = std::function<void(const protocol::NetworkEvent&)>;

    virtual ~Connection() = default;

    // Queue an event for the outbound flow. Never blocks; delivery is best effort.
    virtual void send(const protocol::NetworkEvent& event) = 0;

    // Deliver every event received since the last call, in arrival order, on the caller's thread
    virtual void poll_messages(const EventCallback& callback) = 0;

    // Identity assigned by the relay during the handshake
    virtual protocol::PlayerId local_player_id() const = 0;
};

} // namespace pikelink::client
