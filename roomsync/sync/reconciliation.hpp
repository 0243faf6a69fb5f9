#pragma once
#include <memory>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>
#include "room/broadcaster.hpp"
#include "room/connection_registry.hpp"
#include "room/room_directory.hpp"
#include "storage/event_log.hpp"
#include "sync/event_publisher.hpp"
#include "sync/room_state.hpp"

// Join/rejoin handshake and absorption of events a client buffered offline.
class ReconciliationProtocol {
public:
    using JoinResult = std::variant<RoomStateView, JoinRejection>;

    ReconciliationProtocol(EventLog &log, RoomDirectory &directory, ConnectionRegistry &registry,
                           const Broadcaster &broadcaster, EventPublisher &publisher, Clock clock,
                           std::size_t chat_history_limit);

    // Registers the player, sends it the state view and announces it to the
    // rest of the room, all under the room's serialization lock.
    JoinResult join(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                    std::weak_ptr<PlayerConnection> connection);
    // As join, plus missed_events = drawing events strictly after the watermark.
    // Without a watermark missed_events is empty. Safe to call repeatedly.
    JoinResult rejoin(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                      std::optional<Timestamp> last_event_timestamp, std::weak_ptr<PlayerConnection> connection);

    // Re-attributes each buffered `draw`/`message` to the replaying player and
    // publishes it; other kinds are ignored. There is no idempotency key: a
    // batch replayed twice is stored and broadcast twice.
    // Returns the number of events applied.
    std::size_t apply_replayed_events(const RoomId &room_id, const PlayerId &player_id,
                                      const std::string &player_name, const nlohmann::json &events);

    // snapshot + events after it (or the full log), bounded chat history.
    RoomStateView state_view(const RoomRecord &room);

private:
    JoinResult attach(const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
                      std::weak_ptr<PlayerConnection> connection, bool is_rejoin,
                      std::optional<Timestamp> last_event_timestamp);

    EventLog &m_log;
    RoomDirectory &m_directory;
    ConnectionRegistry &m_registry;
    const Broadcaster &m_broadcaster;
    EventPublisher &m_publisher;
    Clock m_clock;
    std::size_t m_chat_history_limit;
};
