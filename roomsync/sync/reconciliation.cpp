#include "sync/reconciliation.hpp"
#include <limits>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "json/json_impl.hpp"

ReconciliationProtocol::ReconciliationProtocol(EventLog &log, RoomDirectory &directory, ConnectionRegistry &registry,
                                               const Broadcaster &broadcaster, EventPublisher &publisher, Clock clock,
                                               std::size_t chat_history_limit)
    : m_log(log), m_directory(directory), m_registry(registry), m_broadcaster(broadcaster),
      m_publisher(publisher), m_clock(std::move(clock)), m_chat_history_limit(chat_history_limit) {
}

RoomStateView ReconciliationProtocol::state_view(const RoomRecord &room) {
    RoomStateView view{
        .room_id = room.id,
        .room_name = room.name,
    };
    view.chat_history = m_log.chat_history(room.id, m_chat_history_limit);
    auto snapshot = m_log.snapshot(room.id);
    if(snapshot){
        view.drawing_events = m_log.drawing_events_since(room.id, snapshot->timestamp);
        view.canvas_snapshot = std::move(snapshot->data);
    } else {
        view.drawing_events = m_log.drawing_events_since(room.id, std::numeric_limits<Timestamp>::min());
    }
    return view;
}

ReconciliationProtocol::JoinResult ReconciliationProtocol::join(
    const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
    std::weak_ptr<PlayerConnection> connection) {
    return attach(room_id, player_id, player_name, std::move(connection), false, std::nullopt);
}

ReconciliationProtocol::JoinResult ReconciliationProtocol::rejoin(
    const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
    std::optional<Timestamp> last_event_timestamp, std::weak_ptr<PlayerConnection> connection) {
    return attach(room_id, player_id, player_name, std::move(connection), true, last_event_timestamp);
}

ReconciliationProtocol::JoinResult ReconciliationProtocol::attach(
    const RoomId &room_id, const PlayerId &player_id, const std::string &player_name,
    std::weak_ptr<PlayerConnection> connection, bool is_rejoin, std::optional<Timestamp> last_event_timestamp) {
    auto guard = m_registry.serialize(room_id);
    auto room = m_directory.get_room(room_id);
    if(!guard || !room){
        return JoinRejection::RoomNotFound;
    }
    // read before registering so a storage failure leaves no partial join
    auto view = state_view(*room);
    if(is_rejoin){
        view.missed_events = last_event_timestamp
            ? m_log.drawing_events_since(room_id, *last_event_timestamp)
            : std::vector<DrawingEvent>{};
    }

    switch(m_registry.add_player(room_id, Player{
            .player_id = player_id,
            .player_name = player_name,
            .connection = connection,
        })){
        case AddPlayerResult::Added: break;
        case AddPlayerResult::RoomUnavailable: return JoinRejection::RoomNotFound;
        case AddPlayerResult::RoomFull: return JoinRejection::RoomFull;
        case AddPlayerResult::InOtherRoom: return JoinRejection::AlreadyInOtherRoom;
    }
    spdlog::info("[Reconciliation] {} ({}) {} {}", player_name, player_id, is_rejoin ? "rejoined" : "joined", room_id);

    view.player_id = player_id;
    view.player_name = player_name;
    view.active_players = m_registry.list_players(room_id);
    if(auto joined = connection.lock()){
        joined->deliver(nlohmann::json(view).dump());
    }
    m_broadcaster.broadcast(
        room_id,
        presence_message(ServerMessageType::UserJoined, player_id, player_name, m_clock(), is_rejoin),
        player_id);
    return view;
}

std::size_t ReconciliationProtocol::apply_replayed_events(const RoomId &room_id, const PlayerId &player_id,
                                                          const std::string &player_name,
                                                          const nlohmann::json &events) {
    if(!events.is_array()) return 0;
    spdlog::info("[Reconciliation] Replaying {} queued events from {}", events.size(), player_name);

    std::size_t applied{};
    for(const auto &event : events){
        if(!event.is_object()) continue;
        auto type = event.value("type", ClientMessageType::Unknown);
        try{
            switch(type){
                case ClientMessageType::Draw: {
                    auto request = event.get<DrawRequest>();
                    m_publisher.publish_draw(room_id, player_id, request, request.timestamp.value_or(m_clock()));
                    ++applied;
                    break;
                }
                case ClientMessageType::Message: {
                    auto request = event.get<ChatRequest>();
                    m_publisher.publish_chat(room_id, player_id, player_name, request.text,
                                             request.timestamp.value_or(m_clock()));
                    ++applied;
                    break;
                }
                default:
                    break;
            }
        }catch(const nlohmann::json::exception &e){
            spdlog::warn("[Reconciliation] Skipping malformed replayed event from {}: {}", player_id, e.what());
        }catch(const ValidationError &e){
            spdlog::warn("[Reconciliation] Skipping invalid replayed event from {}: {}", player_id, e.what());
        }
    }
    return applied;
}
