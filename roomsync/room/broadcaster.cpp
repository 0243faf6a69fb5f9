#include "room/broadcaster.hpp"

Broadcaster::Broadcaster(const ConnectionRegistry &registry)
    : m_registry(registry) {
}

std::size_t Broadcaster::broadcast(const RoomId &room_id, const nlohmann::json &message,
                                   const std::optional<PlayerId> &exclude_player_id) const {
    auto serialized = message.dump();
    std::size_t delivered{};
    for(const auto &player : m_registry.list_players(room_id)){
        if(player.player_id == exclude_player_id) continue;
        if(auto connection = player.connection.lock()){
            connection->deliver(serialized);
            ++delivered;
        }
    }
    return delivered;
}
