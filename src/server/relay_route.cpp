#include "relay_route.hpp"
#include <variant>

namespace pikelink::server {

using namespace pikelink::protocol;

Delivery route(const NetworkEvent& event, PlayerId sender) {
    return std::visit(Overloaded{
        // Only the relay announces joins and quits
        [](const PlayerJoin&) { return Delivery{Delivery::Kind::Drop, 0}; },
        [](const PlayerQuit&) { return Delivery{Delivery::Kind::Drop, 0}; },
        [&](const FullUpdate&) { return Delivery{Delivery::Kind::AllExcept, sender}; },
        [&](const MovementUpdate&) { return Delivery{Delivery::Kind::AllExcept, sender}; },
        [&](const Chat&) { return Delivery{Delivery::Kind::AllExcept, sender}; },
        [&](const UpdateRequest&) { return Delivery{Delivery::Kind::AllExcept, sender}; },
        [](const BattleDataRequest& e) { return Delivery{Delivery::Kind::One, e.target}; },
        [](const BattleDataResponse& e) { return Delivery{Delivery::Kind::One, e.target}; },
    }, event);
}

} // namespace pikelink::server
