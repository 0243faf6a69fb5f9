#pragma once
#include <optional>
#include <string>
#include <vector>
#include "storage/database.hpp"
#include "storage/records.hpp"

// Append-only chat and drawing history per room plus a single snapshot slot.
//
// Saving a snapshot never deletes history; rows it subsumes stay until an
// explicit compaction_pass() so that a bad snapshot cannot lose data.
class EventLog {
public:
    static constexpr std::size_t max_message_length = 140;

    explicit EventLog(Database &db);

    // Text is trimmed; throws ValidationError when empty or longer than
    // max_message_length code points, NotFoundError for an unknown room.
    EventId append_chat(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                        const std::string &text, Timestamp timestamp);
    // Payload must be a JSON object.
    EventId append_drawing_event(const RoomId &room_id, const PlayerId &player_id, const std::string &event_type,
                                 const nlohmann::json &payload, Timestamp timestamp);

    // Most recent `limit` messages, oldest first.
    std::vector<ChatMessage> chat_history(const RoomId &room_id, std::size_t limit);
    // Events with timestamp strictly greater than `since`, ascending.
    std::vector<DrawingEvent> drawing_events_since(const RoomId &room_id, Timestamp since);

    void save_snapshot(const RoomId &room_id, const std::string &data, Timestamp timestamp);
    std::optional<Snapshot> snapshot(const RoomId &room_id);

    // Drawing rows older than `older_than` go only if a snapshot at or after
    // `older_than` exists; chat rows older than it always go.
    CompactionResult compaction_pass(const RoomId &room_id, Timestamp older_than);

    void clear_drawing_state(const RoomId &room_id);
    void clear_chat_history(const RoomId &room_id);
    void delete_room_data(const RoomId &room_id);

    void flush();

private:
    bool room_exists(const RoomId &room_id);

    Database &m_db;
};
