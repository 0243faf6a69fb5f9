#include "storage/event_log.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "errors.hpp"

EventLog::EventLog(Database &db)
    : m_db(db) {
}

bool EventLog::room_exists(const RoomId &room_id) {
    auto stmt = m_db.prepare("SELECT 1 FROM rooms WHERE id = ?");
    stmt.bind(1, room_id);
    return stmt.step();
}

EventId EventLog::append_chat(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                              const std::string &text, Timestamp timestamp) {
    auto trimmed = trim(text);
    if(trimmed.empty()){
        throw ValidationError("Message is empty");
    }
    if(utf8_length(trimmed) > max_message_length){
        throw ValidationError("Message too long (max 140 characters)");
    }
    auto lock = m_db.acquire();
    if(!room_exists(room_id)){
        throw NotFoundError("Room does not exist");
    }
    m_db.prepare(R"sql(
        INSERT INTO chat_messages (room_id, player_id, player_name, message, timestamp)
        VALUES (?, ?, ?, ?, ?))sql")
        .bind(1, room_id)
        .bind(2, player_id)
        .bind(3, player_name)
        .bind(4, trimmed)
        .bind(5, timestamp)
        .run();
    return m_db.last_insert_id();
}

EventId EventLog::append_drawing_event(const RoomId &room_id, const PlayerId &player_id, const std::string &event_type,
                                       const nlohmann::json &payload, Timestamp timestamp) {
    if(!payload.is_object()){
        throw ValidationError("Drawing payload must be an object");
    }
    auto data = payload.dump();
    auto lock = m_db.acquire();
    if(!room_exists(room_id)){
        throw NotFoundError("Room does not exist");
    }
    m_db.prepare(R"sql(
        INSERT INTO drawing_events (room_id, player_id, event_type, event_data, timestamp)
        VALUES (?, ?, ?, ?, ?))sql")
        .bind(1, room_id)
        .bind(2, player_id)
        .bind(3, event_type)
        .bind(4, data)
        .bind(5, timestamp)
        .run();
    return m_db.last_insert_id();
}

std::vector<ChatMessage> EventLog::chat_history(const RoomId &room_id, std::size_t limit) {
    std::vector<ChatMessage> result;
    auto lock = m_db.acquire();
    auto stmt = m_db.prepare(R"sql(
        SELECT id, player_id, player_name, message, timestamp FROM chat_messages
        WHERE room_id = ?
        ORDER BY timestamp DESC, id DESC
        LIMIT ?)sql");
    stmt.bind(1, room_id).bind(2, static_cast<std::int64_t>(limit));
    while(stmt.step()){
        result.push_back(ChatMessage{
            .id = stmt.column_int(0),
            .room_id = room_id,
            .player_id = stmt.column_text(1),
            .player_name = stmt.column_text(2),
            .text = stmt.column_text(3),
            .timestamp = stmt.column_int(4),
        });
    }
    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<DrawingEvent> EventLog::drawing_events_since(const RoomId &room_id, Timestamp since) {
    std::vector<DrawingEvent> result;
    auto lock = m_db.acquire();
    auto stmt = m_db.prepare(R"sql(
        SELECT id, player_id, event_type, event_data, timestamp FROM drawing_events
        WHERE room_id = ? AND timestamp > ?
        ORDER BY timestamp ASC, id ASC)sql");
    stmt.bind(1, room_id).bind(2, since);
    while(stmt.step()){
        DrawingEvent event{
            .id = stmt.column_int(0),
            .room_id = room_id,
            .player_id = stmt.column_text(1),
            .event_type = stmt.column_text(2),
            .timestamp = stmt.column_int(4),
        };
        // rows are written by append_drawing_event, a parse failure means outside tampering
        event.payload = nlohmann::json::parse(stmt.column_text(3), nullptr, false);
        if(event.payload.is_discarded()){
            spdlog::warn("[EventLog] Skipping corrupt drawing event {} in {}", event.id, room_id);
            continue;
        }
        result.push_back(std::move(event));
    }
    return result;
}

void EventLog::save_snapshot(const RoomId &room_id, const std::string &data, Timestamp timestamp) {
    auto lock = m_db.acquire();
    Transaction tx(m_db);
    m_db.prepare("DELETE FROM canvas_snapshots WHERE room_id = ?").bind(1, room_id).run();
    m_db.prepare("INSERT INTO canvas_snapshots (room_id, snapshot_data, timestamp) VALUES (?, ?, ?)")
        .bind(1, room_id)
        .bind(2, data)
        .bind(3, timestamp)
        .run();
    tx.commit();
}

std::optional<Snapshot> EventLog::snapshot(const RoomId &room_id) {
    auto lock = m_db.acquire();
    auto stmt = m_db.prepare("SELECT snapshot_data, timestamp FROM canvas_snapshots WHERE room_id = ?");
    stmt.bind(1, room_id);
    if(!stmt.step()) return std::nullopt;
    return Snapshot{
        .room_id = room_id,
        .data = stmt.column_text(0),
        .timestamp = stmt.column_int(1),
    };
}

CompactionResult EventLog::compaction_pass(const RoomId &room_id, Timestamp older_than) {
    CompactionResult result;
    auto lock = m_db.acquire();
    Transaction tx(m_db);

    auto covering = m_db.prepare("SELECT 1 FROM canvas_snapshots WHERE room_id = ? AND timestamp >= ?");
    covering.bind(1, room_id).bind(2, older_than);
    if(covering.step()){
        m_db.prepare("DELETE FROM drawing_events WHERE room_id = ? AND timestamp < ?")
            .bind(1, room_id)
            .bind(2, older_than)
            .run();
        result.drawing_events_removed = m_db.changes();
        result.drawing_compacted = true;
    }

    m_db.prepare("DELETE FROM chat_messages WHERE room_id = ? AND timestamp < ?")
        .bind(1, room_id)
        .bind(2, older_than)
        .run();
    result.chat_messages_removed = m_db.changes();

    tx.commit();
    return result;
}

void EventLog::clear_drawing_state(const RoomId &room_id) {
    auto lock = m_db.acquire();
    Transaction tx(m_db);
    m_db.prepare("DELETE FROM drawing_events WHERE room_id = ?").bind(1, room_id).run();
    m_db.prepare("DELETE FROM canvas_snapshots WHERE room_id = ?").bind(1, room_id).run();
    tx.commit();
}

void EventLog::clear_chat_history(const RoomId &room_id) {
    auto lock = m_db.acquire();
    m_db.prepare("DELETE FROM chat_messages WHERE room_id = ?").bind(1, room_id).run();
}

void EventLog::delete_room_data(const RoomId &room_id) {
    auto lock = m_db.acquire();
    Transaction tx(m_db);
    m_db.prepare("DELETE FROM chat_messages WHERE room_id = ?").bind(1, room_id).run();
    m_db.prepare("DELETE FROM drawing_events WHERE room_id = ?").bind(1, room_id).run();
    m_db.prepare("DELETE FROM canvas_snapshots WHERE room_id = ?").bind(1, room_id).run();
    tx.commit();
}

void EventLog::flush() {
    auto lock = m_db.acquire();
    m_db.checkpoint();
}
