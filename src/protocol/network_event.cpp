#include "network_event.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

using json = nlohmann::json;

namespace pikelink::protocol {

const char* event_name(const NetworkEvent& event) {
    return std::visit(Overloaded{
        [](const PlayerJoin&) { return "PlayerJoin"; },
        [](const FullUpdate&) { return "FullUpdate"; },
        [](const MovementUpdate&) { return "MovementUpdate"; },
        [](const PlayerQuit&) { return "PlayerQuit"; },
        [](const Chat&) { return "Chat"; },
        [](const BattleDataRequest&) { return "BattleDataRequest"; },
        [](const BattleDataResponse&) { return "BattleDataResponse"; },
        [](const UpdateRequest&) { return "UpdateRequest"; },
    }, event);
}

std::string encode_line(const NetworkEvent& event) {
    json j = std::visit(Overloaded{
        [](const PlayerJoin& e) { return json{{"id", e.id}}; },
        [](const FullUpdate& e) { return json{{"id", e.id}, {"data", e.data}}; },
        [](const MovementUpdate& e) { return json{{"id", e.id}, {"movement", e.movement}}; },
        [](const PlayerQuit& e) { return json{{"id", e.id}}; },
        [](const Chat& e) { return json{{"id", e.id}, {"message", e.message}}; },
        [](const BattleDataRequest& e) { return json{{"target", e.target}, {"requester", e.requester}}; },
        [](const BattleDataResponse& e) { return json{{"target", e.target}, {"party", e.party}}; },
        [](const UpdateRequest&) { return json::object(); },
    }, event);
    j["type"] = event_name(event);

    std::string line = j.dump();
    line.push_back('\n');
    return line;
}

NetworkEvent decode_line(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw DecodeError("event is not a JSON object");
        }
        const std::string type = j.at("type").get<std::string>();

        if (type == "PlayerJoin") {
            return PlayerJoin{j.at("id").get<PlayerId>()};
        }
        if (type == "FullUpdate") {
            return FullUpdate{j.at("id").get<PlayerId>(), j.at("data").get<PlayerData>()};
        }
        if (type == "MovementUpdate") {
            return MovementUpdate{j.at("id").get<PlayerId>(), j.at("movement").get<MovementData>()};
        }
        if (type == "PlayerQuit") {
            return PlayerQuit{j.at("id").get<PlayerId>()};
        }
        if (type == "Chat") {
            return Chat{j.at("id").get<PlayerId>(), j.at("message").get<std::vector<uint8_t>>()};
        }
        if (type == "BattleDataRequest") {
            return BattleDataRequest{j.at("target").get<PlayerId>(), j.at("requester").get<PlayerId>()};
        }
        if (type == "BattleDataResponse") {
            return BattleDataResponse{j.at("target").get<PlayerId>(), j.at("party").get<Party>()};
        }
        if (type == "UpdateRequest") {
            return UpdateRequest{};
        }

        throw DecodeError("unknown event type '" + type + "'");
    } catch (const json::exception& e) {
        throw DecodeError(std::string("malformed event: ") + e.what());
    }
}

PlayerId decode_handshake(const std::string& line) {
    NetworkEvent event = decode_line(line);
    if (const auto* join = std::get_if<PlayerJoin>(&event)) {
        return join->id;
    }
    throw ProtocolViolation(std::string("expected PlayerJoin handshake, got ") + event_name(event));
}

} // namespace pikelink::protocol
