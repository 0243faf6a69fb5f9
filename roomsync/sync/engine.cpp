#include "sync/engine.hpp"
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "json/json_impl.hpp"

namespace {

std::string rejection_text(JoinRejection rejection, bool is_rejoin) {
    switch(rejection){
        case JoinRejection::RoomNotFound: return is_rejoin ? "Room no longer exists" : "Room does not exist";
        case JoinRejection::RoomFull: return "Room is full";
        case JoinRejection::AlreadyInOtherRoom: return "Player is already in another room";
    }
    return "Join rejected";
}

void reply(const std::shared_ptr<PlayerConnection> &connection, const nlohmann::json &message) {
    if(connection) connection->deliver(message.dump());
}

}

RoomSynchronizationEngine::RoomSynchronizationEngine(Config config, Clock clock)
    : m_config(std::move(config)),
      m_clock(std::move(clock)),
      m_db(m_config.db_path),
      m_log(m_db),
      m_registry(m_clock),
      m_broadcaster(m_registry),
      m_directory(m_db, m_log, m_registry, m_clock,
                  RoomDirectory::Options{.max_players = m_config.max_players, .name_max = m_config.room_name_max}),
      m_publisher(m_log, m_registry, m_broadcaster),
      m_reconciliation(m_log, m_directory, m_registry, m_broadcaster, m_publisher, m_clock,
                       m_config.chat_history_limit) {
}

RoomSynchronizationEngine::~RoomSynchronizationEngine() {
    stop();
}

void RoomSynchronizationEngine::initialize() {
    m_directory.load();
    m_directory.ensure_default_rooms();
}

void RoomSynchronizationEngine::handle_frame(ConnectionState &state,
                                             const std::shared_ptr<PlayerConnection> &connection,
                                             std::string_view frame) {
    auto message = nlohmann::json::parse(frame, nullptr, false);
    if(message.is_discarded() || !message.is_object()){
        spdlog::warn("[Engine] Invalid message format from {}", state.player_id.empty() ? "unattached connection" : state.player_id);
        reply(connection, error_message("Invalid message format"));
        return;
    }
    handle_message(state, connection, message);
}

void RoomSynchronizationEngine::handle_message(ConnectionState &state,
                                               const std::shared_ptr<PlayerConnection> &connection,
                                               const nlohmann::json &message) {
    if(state.phase == ConnectionState::Phase::Closed) return;
    try{
        dispatch(state, connection, message);
        return;
    }catch(const nlohmann::json::exception &e){
        spdlog::warn("[Engine] Malformed message: {}", e.what());
        reply(connection, error_message("Invalid message format"));
    }catch(const PersistenceError &e){
        spdlog::error("[Engine] Storage failure in {}: {}", state.room_id, e.what());
        reply(connection, error_message("Storage failure"));
    }catch(const RoomSyncError &e){
        reply(connection, error_message(e.what()));
    }
    // a failed join leaves nothing registered
    if(state.phase == ConnectionState::Phase::Joining){
        state.phase = ConnectionState::Phase::Unattached;
    }
}

void RoomSynchronizationEngine::dispatch(ConnectionState &state,
                                         const std::shared_ptr<PlayerConnection> &connection,
                                         const nlohmann::json &message) {
    auto type = message.value("type", ClientMessageType::Unknown);
    switch(type){
        case ClientMessageType::Join:
            return on_join(state, connection, message);
        case ClientMessageType::Rejoin:
            return on_rejoin(state, connection, message);
        case ClientMessageType::Unknown:
            spdlog::warn("[Engine] Unknown message type: {}", message.value("type", nlohmann::json()).dump());
            return;
        default:
            break;
    }
    // everything else needs an attached connection
    if(state.phase != ConnectionState::Phase::Active) return;

    switch(type){
        case ClientMessageType::Draw:
            m_publisher.publish_draw(state.room_id, state.player_id, message.get<DrawRequest>(), m_clock());
            break;
        case ClientMessageType::Clear:
            m_publisher.publish_clear(state.room_id, state.player_id, state.player_name, m_clock());
            break;
        case ClientMessageType::Message:
            m_publisher.publish_chat(state.room_id, state.player_id, state.player_name,
                                     message.get<ChatRequest>().text, m_clock());
            break;
        case ClientMessageType::DrawStart:
            on_draw_indicator(state, true);
            break;
        case ClientMessageType::DrawEnd:
            on_draw_indicator(state, false);
            break;
        case ClientMessageType::CanvasSnapshot:
            on_canvas_snapshot(state, message);
            break;
        case ClientMessageType::QueueReplay:
            m_reconciliation.apply_replayed_events(state.room_id, state.player_id, state.player_name,
                                                   message.value("events", nlohmann::json()));
            break;
        default:
            break;
    }
}

void RoomSynchronizationEngine::on_join(ConnectionState &state,
                                        const std::shared_ptr<PlayerConnection> &connection,
                                        const nlohmann::json &message) {
    auto request = message.get<JoinRequest>();
    leave_room(state, connection.get());

    auto player_id = request.player_id.value_or("");
    if(player_id.empty()) player_id = generate_player_id();
    auto player_name = request.player_name.value_or("");
    if(player_name.empty()) player_name = "Player " + player_id.substr(0, 4);

    state.phase = ConnectionState::Phase::Joining;
    state.player_id = player_id;
    state.player_name = player_name;
    auto result = m_reconciliation.join(request.room_id, player_id, player_name, connection);
    finish_attach(state, connection, request.room_id, result, false);
}

void RoomSynchronizationEngine::on_rejoin(ConnectionState &state,
                                          const std::shared_ptr<PlayerConnection> &connection,
                                          const nlohmann::json &message) {
    auto request = message.get<RejoinRequest>();
    if(request.player_id.empty()){
        throw ValidationError("playerId required");
    }
    leave_room(state, connection.get());

    state.phase = ConnectionState::Phase::Joining;
    state.player_id = request.player_id;
    state.player_name = request.player_name;
    auto result = m_reconciliation.rejoin(request.room_id, request.player_id, request.player_name,
                                          request.last_event_timestamp, connection);
    finish_attach(state, connection, request.room_id, result, true);
}

void RoomSynchronizationEngine::finish_attach(ConnectionState &state,
                                              const std::shared_ptr<PlayerConnection> &connection,
                                              const RoomId &room_id,
                                              const ReconciliationProtocol::JoinResult &result, bool is_rejoin) {
    if(auto rejection = std::get_if<JoinRejection>(&result)){
        state.phase = ConnectionState::Phase::Unattached;
        reply(connection, error_message(rejection_text(*rejection, is_rejoin)));
        return;
    }
    state.phase = ConnectionState::Phase::Active;
    state.room_id = room_id;
}

void RoomSynchronizationEngine::on_draw_indicator(const ConnectionState &state, bool is_drawing) {
    auto guard = m_registry.serialize(state.room_id);
    if(!guard) return;
    m_registry.set_drawing_flag(state.room_id, state.player_id, is_drawing);
    m_broadcaster.broadcast(
        state.room_id,
        presence_message(is_drawing ? ServerMessageType::DrawStart : ServerMessageType::DrawEnd,
                         state.player_id, state.player_name),
        state.player_id);
}

void RoomSynchronizationEngine::on_canvas_snapshot(const ConnectionState &state, const nlohmann::json &message) {
    auto request = message.get<SnapshotRequest>();
    if(!request.snapshot_data || request.snapshot_data->empty()) return;
    auto guard = m_registry.serialize(state.room_id);
    if(!guard) return;
    m_log.save_snapshot(state.room_id, *request.snapshot_data, m_clock());
    spdlog::info("[Engine] Canvas snapshot saved for room {}", state.room_id);
}

void RoomSynchronizationEngine::disconnect(ConnectionState &state, const PlayerConnection *connection) {
    if(state.phase == ConnectionState::Phase::Closed) return;
    leave_room(state, connection);
    state.phase = ConnectionState::Phase::Closed;
}

void RoomSynchronizationEngine::leave_room(ConnectionState &state, const PlayerConnection *connection) {
    if(state.phase != ConnectionState::Phase::Active) return;
    auto room_id = std::move(state.room_id);
    state.room_id.clear();
    state.phase = ConnectionState::Phase::Unattached;

    auto guard = m_registry.serialize(room_id);
    if(!guard) return;
    if(!m_registry.remove_player(room_id, state.player_id, connection)) return;
    spdlog::info("[Engine] Player {} ({}) left {}", state.player_name, state.player_id, room_id);
    m_broadcaster.broadcast(
        room_id,
        presence_message(ServerMessageType::UserLeft, state.player_id, state.player_name, m_clock()),
        state.player_id);
}

PlayerId RoomSynchronizationEngine::generate_player_id() {
    std::lock_guard lock(m_uuid_mutex);
    return boost::uuids::to_string(m_uuid_gen());
}

void RoomSynchronizationEngine::flush_storage() {
    m_log.flush();
    spdlog::debug("[Engine] Storage flushed");
}

void RoomSynchronizationEngine::run_maintenance() {
    auto expired = m_directory.expire_idle_custom_rooms(m_config.room_idle);
    if(!expired.empty()){
        spdlog::info("[Engine] Expired {} idle custom rooms", expired.size());
    }
    auto cutoff = m_clock() - std::chrono::duration_cast<std::chrono::milliseconds>(m_config.retention).count();
    for(const auto &room_id : m_directory.room_ids()){
        auto guard = m_registry.serialize(room_id);
        if(!guard) continue;
        try{
            auto result = m_log.compaction_pass(room_id, cutoff);
            if(result.drawing_events_removed || result.chat_messages_removed){
                spdlog::info("[Engine] Compacted {}: {} drawing events, {} chat messages",
                             room_id, result.drawing_events_removed, result.chat_messages_removed);
            }
        }catch(const PersistenceError &e){
            spdlog::error("[Engine] Compaction of {} failed: {}", room_id, e.what());
        }
    }
}

void RoomSynchronizationEngine::start_background_tasks(net::any_io_executor executor) {
    m_tasks.push_back(std::make_shared<ScheduledTask>(
        executor, "storage flush", m_config.flush_interval, [this]{ flush_storage(); }));
    m_tasks.push_back(std::make_shared<ScheduledTask>(
        executor, "maintenance", m_config.maintenance_interval, [this]{ run_maintenance(); }));
    for(auto &task : m_tasks){
        task->start();
    }
}

void RoomSynchronizationEngine::stop() {
    for(auto &task : m_tasks){
        task->cancel();
    }
    m_tasks.clear();
}

const Config &RoomSynchronizationEngine::config() const {
    return m_config;
}

Database &RoomSynchronizationEngine::database() {
    return m_db;
}

EventLog &RoomSynchronizationEngine::event_log() {
    return m_log;
}

RoomDirectory &RoomSynchronizationEngine::directory() {
    return m_directory;
}

ConnectionRegistry &RoomSynchronizationEngine::registry() {
    return m_registry;
}
