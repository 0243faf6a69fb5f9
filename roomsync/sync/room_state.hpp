#pragma once
#include <optional>
#include <string>
#include <vector>
#include "room/player.hpp"
#include "storage/records.hpp"

// What a (re)joining client needs to rebuild the room locally.
struct RoomStateView {
    RoomId room_id;
    std::string room_name;
    PlayerId player_id;
    std::string player_name;
    std::vector<Player> active_players;
    std::vector<ChatMessage> chat_history;
    // events after the snapshot, or the full log when there is none
    std::vector<DrawingEvent> drawing_events;
    std::optional<std::string> canvas_snapshot;
    // set for rejoin only
    std::optional<std::vector<DrawingEvent>> missed_events;
};

enum class JoinRejection { RoomNotFound, RoomFull, AlreadyInOtherRoom };
