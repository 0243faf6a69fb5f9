#include "sync/event_publisher.hpp"
#include <spdlog/spdlog.h>
#include "errors.hpp"

EventPublisher::EventPublisher(EventLog &log, ConnectionRegistry &registry, const Broadcaster &broadcaster)
    : m_log(log), m_registry(registry), m_broadcaster(broadcaster) {
}

DrawingEvent EventPublisher::publish_draw(const RoomId &room_id, const PlayerId &player_id,
                                          const DrawRequest &request, Timestamp timestamp) {
    DrawingEvent event{
        .room_id = room_id,
        .player_id = player_id,
        .event_type = "draw",
        .payload = draw_payload(request),
        .timestamp = timestamp,
    };
    auto guard = m_registry.serialize(room_id);
    if(!guard){
        throw NotFoundError("Room does not exist");
    }
    try{
        event.id = m_log.append_drawing_event(room_id, player_id, event.event_type, event.payload, timestamp);
    }catch(const PersistenceError &e){
        spdlog::error("[EventPublisher] Draw in {} not persisted: {}", room_id, e.what());
    }
    m_registry.touch(room_id);

    nlohmann::json message = event;
    if(event.id == 0) message.erase("id");
    m_broadcaster.broadcast(room_id, message, player_id);
    return event;
}

ChatMessage EventPublisher::publish_chat(const RoomId &room_id, const PlayerId &player_id,
                                         const std::string &player_name, const std::string &text,
                                         Timestamp timestamp) {
    ChatMessage message{
        .room_id = room_id,
        .player_id = player_id,
        .player_name = player_name,
        .text = trim(text),
        .timestamp = timestamp,
    };
    auto guard = m_registry.serialize(room_id);
    if(!guard){
        throw NotFoundError("Room does not exist");
    }
    try{
        message.id = m_log.append_chat(room_id, player_id, player_name, text, timestamp);
    }catch(const PersistenceError &e){
        // validation runs before any storage access, so the text is known good here
        spdlog::error("[EventPublisher] Message in {} not persisted: {}", room_id, e.what());
    }
    m_registry.touch(room_id);

    nlohmann::json wire = message;
    wire["type"] = ServerMessageType::Message;
    if(message.id == 0) wire.erase("id");
    m_broadcaster.broadcast(room_id, wire);
    return message;
}

void EventPublisher::publish_clear(const RoomId &room_id, const PlayerId &player_id,
                                   const std::string &player_name, Timestamp timestamp) {
    auto guard = m_registry.serialize(room_id);
    if(!guard){
        throw NotFoundError("Room does not exist");
    }
    try{
        m_log.clear_drawing_state(room_id);
        spdlog::info("[EventPublisher] Canvas cleared for room {}", room_id);
    }catch(const PersistenceError &e){
        spdlog::error("[EventPublisher] Clear in {} not persisted: {}", room_id, e.what());
    }
    m_registry.touch(room_id);
    m_broadcaster.broadcast(room_id, {
        {"type", ServerMessageType::Clear},
        {"playerId", player_id},
        {"playerName", player_name},
        {"timestamp", timestamp},
    });
}
