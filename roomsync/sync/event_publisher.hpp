#pragma once
#include <optional>
#include "json/json_impl.hpp"
#include "room/broadcaster.hpp"
#include "room/connection_registry.hpp"
#include "storage/event_log.hpp"

// Persists a room event and fans it out, both under the room's serialization
// lock so live delivery order matches the replay order of the log.
//
// A PersistenceError is logged and the broadcast still goes out: the event is
// then only lost for clients joining later.
class EventPublisher {
public:
    EventPublisher(EventLog &log, ConnectionRegistry &registry, const Broadcaster &broadcaster);

    // Broadcast excludes the drawer. Returns the stored event (id 0 if not persisted).
    DrawingEvent publish_draw(const RoomId &room_id, const PlayerId &player_id,
                              const DrawRequest &request, Timestamp timestamp);
    // Throws ValidationError for empty or oversized text. Broadcast includes the sender.
    ChatMessage publish_chat(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                             const std::string &text, Timestamp timestamp);
    // Drops the room's drawing events and snapshot, then tells everyone.
    void publish_clear(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                       Timestamp timestamp);

private:
    EventLog &m_log;
    ConnectionRegistry &m_registry;
    const Broadcaster &m_broadcaster;
};
