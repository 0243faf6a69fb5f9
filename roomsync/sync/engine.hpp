#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include <nlohmann/json.hpp>
#include "common.hpp"
#include "config.hpp"
#include "room/broadcaster.hpp"
#include "room/connection_registry.hpp"
#include "room/room_directory.hpp"
#include "storage/database.hpp"
#include "storage/event_log.hpp"
#include "sync/event_publisher.hpp"
#include "sync/reconciliation.hpp"
#include "sync/scheduled_task.hpp"

// Per-connection protocol state. Closed is terminal.
struct ConnectionState {
    enum class Phase { Unattached, Joining, Active, Closed };

    Phase phase = Phase::Unattached;
    RoomId room_id;
    PlayerId player_id;
    std::string player_name;
};

// Owns every room's state for one server instance. Instances are fully
// independent, so tests can run several side by side.
class RoomSynchronizationEngine {
public:
    explicit RoomSynchronizationEngine(Config config, Clock clock = system_now_ms);
    ~RoomSynchronizationEngine();

    RoomSynchronizationEngine(const RoomSynchronizationEngine&) = delete;
    RoomSynchronizationEngine& operator=(const RoomSynchronizationEngine&) = delete;

    // Loads persisted rooms and makes sure the built-in ones exist.
    void initialize();

    // One inbound frame. Never throws: failures become an `error` reply.
    void handle_frame(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                      std::string_view frame);
    void handle_message(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                        const nlohmann::json &message);
    // Connection is gone: leave the room and announce it. Idempotent.
    void disconnect(ConnectionState &state, const PlayerConnection *connection);

    void flush_storage();
    // Idle custom room expiry followed by a compaction pass over every room.
    void run_maintenance();

    void start_background_tasks(net::any_io_executor executor);
    void stop();

    const Config &config() const;
    Database &database();
    EventLog &event_log();
    RoomDirectory &directory();
    ConnectionRegistry &registry();

private:
    void dispatch(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                  const nlohmann::json &message);
    void on_join(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                 const nlohmann::json &message);
    void on_rejoin(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                   const nlohmann::json &message);
    void on_draw_indicator(const ConnectionState &state, bool is_drawing);
    void on_canvas_snapshot(const ConnectionState &state, const nlohmann::json &message);

    // Shared tail of join and rejoin.
    void finish_attach(ConnectionState &state, const std::shared_ptr<PlayerConnection> &connection,
                       const RoomId &room_id, const ReconciliationProtocol::JoinResult &result, bool is_rejoin);
    void leave_room(ConnectionState &state, const PlayerConnection *connection);
    PlayerId generate_player_id();

    Config m_config;
    Clock m_clock;
    Database m_db;
    EventLog m_log;
    ConnectionRegistry m_registry;
    Broadcaster m_broadcaster;
    RoomDirectory m_directory;
    EventPublisher m_publisher;
    ReconciliationProtocol m_reconciliation;

    std::mutex m_uuid_mutex;
    boost::uuids::random_generator m_uuid_gen;
    std::vector<std::shared_ptr<ScheduledTask>> m_tasks;
};
