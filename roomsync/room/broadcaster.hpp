#pragma once
#include <optional>
#include <nlohmann/json.hpp>
#include "room/connection_registry.hpp"

// One-way fan-out to the live connections of a room.
//
// Delivery is fire-and-forget: a connection that is gone or closing simply
// misses the frame and nobody is told. State is recovered through join/rejoin
// against the event log, not through retries here.
class Broadcaster {
public:
    explicit Broadcaster(const ConnectionRegistry &registry);

    // Returns the number of connections the frame was queued on.
    std::size_t broadcast(const RoomId &room_id, const nlohmann::json &message,
                          const std::optional<PlayerId> &exclude_player_id = std::nullopt) const;

private:
    const ConnectionRegistry &m_registry;
};
