#include "room/connection_registry.hpp"
#include <spdlog/spdlog.h>

ConnectionRegistry::RoomLock::RoomLock(std::shared_ptr<RoomSlot> slot)
    : m_slot(std::move(slot)), m_lock(m_slot->serial_mutex) {
}

ConnectionRegistry::ConnectionRegistry(Clock clock)
    : m_clock(std::move(clock)) {
}

std::shared_ptr<ConnectionRegistry::RoomSlot> ConnectionRegistry::find(const RoomId &room_id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_rooms.find(room_id);
    if(it == m_rooms.end()) return nullptr;
    return it->second;
}

void ConnectionRegistry::attach_room(const RoomId &room_id, std::size_t max_players) {
    std::lock_guard lock(m_mutex);
    auto it = m_rooms.find(room_id);
    if(it != m_rooms.end()){
        std::lock_guard state_lock(it->second->state_mutex);
        it->second->max_players = max_players;
        return;
    }
    auto slot = std::make_shared<RoomSlot>();
    slot->max_players = max_players;
    slot->last_activity = m_clock();
    m_rooms.emplace(room_id, std::move(slot));
}

void ConnectionRegistry::detach_room(const RoomId &room_id) {
    std::shared_ptr<RoomSlot> slot;
    {
        std::lock_guard lock(m_mutex);
        auto it = m_rooms.find(room_id);
        if(it == m_rooms.end()) return;
        slot = std::move(it->second);
        m_rooms.erase(it);
    }
    std::lock_guard state_lock(slot->state_mutex);
    slot->is_dead = true;
    std::lock_guard index_lock(m_index_mutex);
    for(const auto &[player_id, player] : slot->players){
        auto it = m_player_rooms.find(player_id);
        if(it != m_player_rooms.end() && it->second == room_id){
            m_player_rooms.erase(it);
        }
    }
    slot->players.clear();
}

bool ConnectionRegistry::has_room(const RoomId &room_id) const {
    return find(room_id) != nullptr;
}

std::optional<ConnectionRegistry::RoomLock> ConnectionRegistry::serialize(const RoomId &room_id) {
    auto slot = find(room_id);
    if(!slot) return std::nullopt;
    return std::optional<RoomLock>(std::in_place, std::move(slot));
}

AddPlayerResult ConnectionRegistry::add_player(const RoomId &room_id, Player player) {
    auto slot = find(room_id);
    if(!slot) return AddPlayerResult::RoomUnavailable;

    std::lock_guard state_lock(slot->state_mutex);
    if(slot->is_dead) return AddPlayerResult::RoomUnavailable;
    auto existing = slot->players.find(player.player_id);
    if(existing == slot->players.end() && slot->players.size() >= slot->max_players){
        spdlog::info("[Registry] Room {} is full", room_id);
        return AddPlayerResult::RoomFull;
    }
    {
        std::lock_guard index_lock(m_index_mutex);
        auto [it, inserted] = m_player_rooms.emplace(player.player_id, room_id);
        if(!inserted && it->second != room_id){
            spdlog::info("[Registry] Player {} is already active in {}", player.player_id, it->second);
            return AddPlayerResult::InOtherRoom;
        }
    }
    slot->last_activity = m_clock();
    if(existing != slot->players.end()){
        existing->second = std::move(player);
    } else {
        auto player_id = player.player_id;
        slot->players.emplace(std::move(player_id), std::move(player));
    }
    return AddPlayerResult::Added;
}

bool ConnectionRegistry::remove_player(const RoomId &room_id, const PlayerId &player_id,
                                       const PlayerConnection *connection) {
    auto slot = find(room_id);
    if(!slot) return false;

    std::lock_guard state_lock(slot->state_mutex);
    auto it = slot->players.find(player_id);
    if(it == slot->players.end()) return false;
    if(connection){
        auto current = it->second.connection.lock();
        // a newer connection of the same player took the entry over
        if(current && current.get() != connection) return false;
    }
    slot->players.erase(it);
    slot->last_activity = m_clock();
    std::lock_guard index_lock(m_index_mutex);
    auto index = m_player_rooms.find(player_id);
    if(index != m_player_rooms.end() && index->second == room_id){
        m_player_rooms.erase(index);
    }
    return true;
}

std::vector<Player> ConnectionRegistry::list_players(const RoomId &room_id) const {
    std::vector<Player> result;
    auto slot = find(room_id);
    if(!slot) return result;
    std::lock_guard state_lock(slot->state_mutex);
    result.reserve(slot->players.size());
    for(const auto &[id, player] : slot->players){
        result.push_back(player);
    }
    return result;
}

void ConnectionRegistry::set_drawing_flag(const RoomId &room_id, const PlayerId &player_id, bool is_drawing) {
    auto slot = find(room_id);
    if(!slot) return;
    std::lock_guard state_lock(slot->state_mutex);
    auto it = slot->players.find(player_id);
    if(it != slot->players.end()){
        it->second.is_drawing = is_drawing;
    }
}

std::size_t ConnectionRegistry::player_count(const RoomId &room_id) const {
    auto slot = find(room_id);
    if(!slot) return 0;
    std::lock_guard state_lock(slot->state_mutex);
    return slot->players.size();
}

std::optional<RoomId> ConnectionRegistry::room_of(const PlayerId &player_id) const {
    std::lock_guard index_lock(m_index_mutex);
    auto it = m_player_rooms.find(player_id);
    if(it == m_player_rooms.end()) return std::nullopt;
    return it->second;
}

void ConnectionRegistry::touch(const RoomId &room_id) {
    if(auto slot = find(room_id)){
        std::lock_guard state_lock(slot->state_mutex);
        slot->last_activity = m_clock();
    }
}

std::optional<Timestamp> ConnectionRegistry::last_activity(const RoomId &room_id) const {
    auto slot = find(room_id);
    if(!slot) return std::nullopt;
    std::lock_guard state_lock(slot->state_mutex);
    return slot->last_activity;
}
