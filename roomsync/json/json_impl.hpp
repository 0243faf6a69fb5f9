#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "room/player.hpp"
#include "storage/records.hpp"
#include "sync/room_state.hpp"

NLOHMANN_JSON_NAMESPACE_BEGIN
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt) j = *opt; else j = nullptr;
    }
    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) opt = std::nullopt; else opt = j.get<T>();
    }
};
NLOHMANN_JSON_NAMESPACE_END

// Missing and null keys both read as nullopt.
template <typename T>
std::optional<T> optional_field(const nlohmann::json &j, const char *key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

enum class ClientMessageType {
    Unknown, Join, Rejoin, Draw, Clear, Message, DrawStart, DrawEnd, CanvasSnapshot, QueueReplay
};
enum class ServerMessageType {
    RoomState, RejoinState, UserJoined, UserLeft, Draw, Clear, Message, DrawStart, DrawEnd, Error
};

NLOHMANN_JSON_SERIALIZE_ENUM(ClientMessageType, {
    {ClientMessageType::Unknown, nullptr},
    {ClientMessageType::Join, "join"},
    {ClientMessageType::Rejoin, "rejoin"},
    {ClientMessageType::Draw, "draw"},
    {ClientMessageType::Clear, "clear"},
    {ClientMessageType::Message, "message"},
    {ClientMessageType::DrawStart, "drawStart"},
    {ClientMessageType::DrawEnd, "drawEnd"},
    {ClientMessageType::CanvasSnapshot, "canvasSnapshot"},
    {ClientMessageType::QueueReplay, "queueReplay"},
})
NLOHMANN_JSON_SERIALIZE_ENUM(ServerMessageType, {
    {ServerMessageType::RoomState, "roomState"},
    {ServerMessageType::RejoinState, "rejoinState"},
    {ServerMessageType::UserJoined, "userJoined"},
    {ServerMessageType::UserLeft, "userLeft"},
    {ServerMessageType::Draw, "draw"},
    {ServerMessageType::Clear, "clear"},
    {ServerMessageType::Message, "message"},
    {ServerMessageType::DrawStart, "drawStart"},
    {ServerMessageType::DrawEnd, "drawEnd"},
    {ServerMessageType::Error, "error"},
})

struct JoinRequest {
    RoomId room_id;
    std::optional<PlayerId> player_id;
    std::optional<std::string> player_name;
};
struct RejoinRequest {
    RoomId room_id;
    PlayerId player_id;
    std::string player_name;
    std::optional<Timestamp> last_event_timestamp;
};
struct DrawRequest {
    nlohmann::json points;
    nlohmann::json color;
    nlohmann::json size;
    std::optional<std::string> tool;
    std::optional<Timestamp> timestamp; // only honoured for replayed events
};
struct ChatRequest {
    std::string text;
    std::optional<Timestamp> timestamp; // only honoured for replayed events
};
struct SnapshotRequest {
    std::optional<std::string> snapshot_data;
};

inline void from_json(const nlohmann::json &j, JoinRequest &r) {
    j.at("roomId").get_to(r.room_id);
    r.player_id = optional_field<PlayerId>(j, "playerId");
    r.player_name = optional_field<std::string>(j, "playerName");
}
inline void from_json(const nlohmann::json &j, RejoinRequest &r) {
    j.at("roomId").get_to(r.room_id);
    j.at("playerId").get_to(r.player_id);
    j.at("playerName").get_to(r.player_name);
    r.last_event_timestamp = optional_field<Timestamp>(j, "lastEventTimestamp");
}
inline void from_json(const nlohmann::json &j, DrawRequest &r) {
    r.points = j.value("points", nlohmann::json());
    r.color = j.value("color", nlohmann::json());
    r.size = j.value("size", nlohmann::json());
    r.tool = optional_field<std::string>(j, "tool");
    r.timestamp = optional_field<Timestamp>(j, "timestamp");
}
inline void from_json(const nlohmann::json &j, ChatRequest &r) {
    j.at("text").get_to(r.text);
    r.timestamp = optional_field<Timestamp>(j, "timestamp");
}
inline void from_json(const nlohmann::json &j, SnapshotRequest &r) {
    r.snapshot_data = optional_field<std::string>(j, "snapshotData");
}

// Stored form of a draw: {points, color, size, tool}.
inline nlohmann::json draw_payload(const DrawRequest &r) {
    return {
        {"points", r.points},
        {"color", r.color},
        {"size", r.size},
        {"tool", r.tool.value_or("pen")},
    };
}

inline void to_json(nlohmann::json &j, const Player &p) {
    j = {
        {"playerId", p.player_id},
        {"playerName", p.player_name},
        {"isDrawing", p.is_drawing},
    };
}
inline void to_json(nlohmann::json &j, const ChatMessage &m) {
    j = {
        {"id", m.id},
        {"playerId", m.player_id},
        {"playerName", m.player_name},
        {"text", m.text},
        {"timestamp", m.timestamp},
    };
}
// Payload keys are flattened next to the attribution.
inline void to_json(nlohmann::json &j, const DrawingEvent &e) {
    j = e.payload.is_object() ? e.payload : nlohmann::json::object();
    j["id"] = e.id;
    j["type"] = e.event_type;
    j["playerId"] = e.player_id;
    j["timestamp"] = e.timestamp;
}
inline void to_json(nlohmann::json &j, const RoomInfo &r) {
    j = {
        {"id", r.id},
        {"name", r.name},
        {"playerCount", r.player_count},
        {"maxPlayers", r.max_players},
        {"isCustom", r.is_custom},
    };
}
inline void to_json(nlohmann::json &j, const RoomStateView &v) {
    j = {
        {"type", v.missed_events ? ServerMessageType::RejoinState : ServerMessageType::RoomState},
        {"roomId", v.room_id},
        {"roomName", v.room_name},
        {"playerId", v.player_id},
        {"playerName", v.player_name},
        {"activePlayers", v.active_players},
        {"chatHistory", v.chat_history},
        {"drawingEvents", v.drawing_events},
        {"canvasSnapshot", v.canvas_snapshot},
    };
    if (v.missed_events) j["missedEvents"] = *v.missed_events;
}

struct ErrorMessage {
    ServerMessageType type = ServerMessageType::Error;
    std::string message;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ErrorMessage, type, message)

inline nlohmann::json error_message(std::string text) {
    return ErrorMessage{.message = std::move(text)};
}

// userJoined / userLeft / drawStart / drawEnd
inline nlohmann::json presence_message(ServerMessageType type, const PlayerId &player_id,
                                       const std::string &player_name, std::optional<Timestamp> timestamp = std::nullopt,
                                       bool is_rejoin = false) {
    nlohmann::json j = {
        {"type", type},
        {"playerId", player_id},
        {"playerName", player_name},
    };
    if (timestamp) j["timestamp"] = *timestamp;
    if (is_rejoin) j["isRejoin"] = true;
    return j;
}
