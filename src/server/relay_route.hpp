#pragma once

#include "protocol/network_event.hpp"

namespace pikelink::server {

// Where the relay forwards an event received from `sender`
struct Delivery {
    enum class Kind {
        Drop,       // Not something a client may send
        AllExcept,  // Every connected client but the sender
        One         // Only `player`
    };

    Kind kind = Kind::Drop;
    protocol::PlayerId player = 0;

    bool operator==(const Delivery&) const = default;
};

Delivery route(const protocol::NetworkEvent& event, protocol::PlayerId sender);

} // namespace pikelink::server
