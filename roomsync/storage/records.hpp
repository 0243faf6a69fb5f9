#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "common.hpp"

using RoomId = std::string;
using PlayerId = std::string;
using EventId = std::int64_t;

struct RoomRecord {
    RoomId id;
    std::string name;
    Timestamp created_at{};
    std::size_t max_players = 4;
    bool is_custom = false;
};

// RoomRecord joined with the live player count.
struct RoomInfo {
    RoomId id;
    std::string name;
    std::size_t player_count{};
    std::size_t max_players{};
    bool is_custom = false;
};

// Ordered by (timestamp, id).
struct ChatMessage {
    EventId id{};
    RoomId room_id;
    PlayerId player_id;
    std::string player_name;
    std::string text;
    Timestamp timestamp{};
};

struct DrawingEvent {
    EventId id{};
    RoomId room_id;
    PlayerId player_id;
    std::string event_type;
    nlohmann::json payload = nlohmann::json::object();
    Timestamp timestamp{};
};

struct Snapshot {
    RoomId room_id;
    std::string data;
    Timestamp timestamp{};
};

struct CompactionResult {
    std::size_t drawing_events_removed{};
    std::size_t chat_messages_removed{};
    // false when drawing rows were kept because no covering snapshot exists
    bool drawing_compacted = false;
};
