#pragma once

#include "protocol/player_data.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace pikelink::client {

// Remote players keyed by id. Writes happen only from PlayerSync's inbound
// pass on the driver thread; the lock keeps readers on other threads safe.
class PlayerTable {
public:
    void upsert(const protocol::PlayerData& data);

    // Returns false (and changes nothing) when the id is not present
    bool update_movement(protocol::PlayerId id, const protocol::MovementData& movement);

    bool remove(protocol::PlayerId id);

    std::optional<protocol::PlayerData> find(protocol::PlayerId id) const;

    // First player (if any) for which the predicate holds
    std::optional<protocol::PlayerData> find_if(
        const std::function<bool(const protocol::PlayerData&)>& predicate) const;

    std::vector<protocol::PlayerData> snapshot() const;

    size_t size() const;
    void clear();

private:
    std::unordered_map<protocol::PlayerId, protocol::PlayerData> players_;
    mutable std::mutex mutex_;
};

} // namespace pikelink::client
