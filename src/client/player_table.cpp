#include "player_table.hpp"
#include <mutex>
#include <optional>
#include <vector>

namespace pikelink::client {

using namespace pikelink::protocol;

void PlayerTable::upsert(const PlayerData& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    players_[data.id] = data;
}

bool PlayerTable::update_movement(PlayerId id, const MovementData& movement) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(id);
    if (it == players_.end()) return false;
    it->second.movement = movement;
    return true;
}

bool PlayerTable::remove(PlayerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return players_.erase(id) > 0;
}

std::optional<PlayerData> PlayerTable::find(PlayerId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(id);
    if (it == players_.end()) return std::nullopt;
    return it->second;
}

std::optional<PlayerData> PlayerTable::find_if(
    const std::function<bool(const PlayerData&)>& predicate) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, player] : players_) {
        if (predicate(player)) return player;
    }
    return std::nullopt;
}

std::vector<PlayerData> PlayerTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PlayerData> out;
    out.reserve(players_.size());
    for (const auto& [id, player] : players_) {
        out.push_back(player);
    }
    return out;
}

size_t PlayerTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return players_.size();
}

void PlayerTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    players_.clear();
}

} // namespace pikelink::client
