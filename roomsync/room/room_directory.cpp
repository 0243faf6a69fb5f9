#include "room/room_directory.hpp"
#include <algorithm>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>
#include "errors.hpp"

RoomDirectory::RoomDirectory(Database &db, EventLog &log, ConnectionRegistry &registry, Clock clock, Options options)
    : m_db(db), m_log(log), m_registry(registry), m_clock(std::move(clock)), m_options(options) {
}

void RoomDirectory::load() {
    std::vector<RoomRecord> rooms;
    {
        auto lock = m_db.acquire();
        auto stmt = m_db.prepare("SELECT id, name, created_at, max_players, is_custom FROM rooms");
        while(stmt.step()){
            auto max_players = stmt.column_int(3);
            rooms.push_back(RoomRecord{
                .id = stmt.column_text(0),
                .name = stmt.column_text(1),
                .created_at = stmt.column_int(2),
                .max_players = max_players > 0 ? static_cast<std::size_t>(max_players) : m_options.max_players,
                .is_custom = stmt.column_int(4) == 1,
            });
        }
    }
    std::lock_guard lock(m_mutex);
    for(auto &room : rooms){
        m_registry.attach_room(room.id, room.max_players);
        auto id = room.id;
        m_rooms.insert_or_assign(std::move(id), std::move(room));
    }
    spdlog::info("[RoomDirectory] Loaded {} rooms", m_rooms.size());
}

void RoomDirectory::ensure_default_rooms() {
    for(char letter : {'A', 'B', 'C', 'D'}){
        RoomId id = std::string("chat-") + static_cast<char>(letter - 'A' + 'a');
        if(get_room(id)) continue;
        create_room(std::string("Chat ") + letter, id, false);
        spdlog::info("[RoomDirectory] Created default room: Chat {}", letter);
    }
}

RoomRecord RoomDirectory::create_room(const std::string &name, const RoomId &id, bool is_custom) {
    auto trimmed = trim(name);
    if(trimmed.empty()){
        throw ValidationError("Room name required");
    }
    if(utf8_length(trimmed) > m_options.name_max){
        throw ValidationError("Room name too long (max " + std::to_string(m_options.name_max) + " characters)");
    }
    if(id.empty()){
        throw ValidationError("Room id required");
    }

    RoomRecord room{
        .id = id,
        .name = trimmed,
        .created_at = m_clock(),
        .max_players = m_options.max_players,
        .is_custom = is_custom,
    };
    {
        auto lock = m_db.acquire();
        m_db.prepare(R"sql(
            INSERT INTO rooms (id, name, created_at, max_players, is_custom)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                name = excluded.name,
                max_players = excluded.max_players,
                is_custom = excluded.is_custom)sql")
            .bind(1, room.id)
            .bind(2, room.name)
            .bind(3, room.created_at)
            .bind(4, static_cast<std::int64_t>(room.max_players))
            .bind(5, std::int64_t{room.is_custom ? 1 : 0})
            .run();
    }

    std::lock_guard lock(m_mutex);
    if(auto it = m_rooms.find(id); it != m_rooms.end()){
        room.created_at = it->second.created_at;
        it->second = room;
    } else {
        m_rooms.emplace(id, room);
    }
    m_registry.attach_room(id, room.max_players);
    spdlog::info("[RoomDirectory] Created room: {} ({})", room.name, room.id);
    return room;
}

RoomRecord RoomDirectory::create_custom_room(const std::string &name) {
    RoomId id;
    {
        std::lock_guard lock(m_mutex);
        do {
            id = "custom-" + boost::uuids::to_string(m_uuid_gen()).substr(0, 8);
        } while(m_rooms.count(id));
    }
    return create_room(name, id, true);
}

std::optional<RoomRecord> RoomDirectory::get_room(const RoomId &id) const {
    std::lock_guard lock(m_mutex);
    auto it = m_rooms.find(id);
    if(it == m_rooms.end()) return std::nullopt;
    return it->second;
}

RoomInfo RoomDirectory::make_info(const RoomRecord &room) const {
    return RoomInfo{
        .id = room.id,
        .name = room.name,
        .player_count = m_registry.player_count(room.id),
        .max_players = room.max_players,
        .is_custom = room.is_custom,
    };
}

std::optional<RoomInfo> RoomDirectory::room_info(const RoomId &id) const {
    auto room = get_room(id);
    if(!room) return std::nullopt;
    return make_info(*room);
}

std::vector<RoomInfo> RoomDirectory::list_rooms() const {
    std::vector<RoomRecord> rooms;
    {
        std::lock_guard lock(m_mutex);
        rooms.reserve(m_rooms.size());
        for(const auto &[id, room] : m_rooms){
            rooms.push_back(room);
        }
    }
    std::sort(rooms.begin(), rooms.end(), [](const RoomRecord &a, const RoomRecord &b){
        if(a.is_custom != b.is_custom) return !a.is_custom;
        if(a.name != b.name) return a.name < b.name;
        return a.id < b.id;
    });
    std::vector<RoomInfo> result;
    result.reserve(rooms.size());
    for(const auto &room : rooms){
        result.push_back(make_info(room));
    }
    return result;
}

std::vector<RoomId> RoomDirectory::room_ids() const {
    std::vector<RoomId> result;
    std::lock_guard lock(m_mutex);
    result.reserve(m_rooms.size());
    for(const auto &[id, room] : m_rooms){
        result.push_back(id);
    }
    return result;
}

void RoomDirectory::delete_room(const RoomId &id) {
    auto room = get_room(id);
    if(!room){
        throw NotFoundError("Room not found");
    }
    if(!room->is_custom){
        throw PermissionError("Cannot delete default rooms");
    }
    auto guard = m_registry.serialize(id);
    if(m_registry.player_count(id) > 0){
        throw ConflictError("Cannot delete room with active players");
    }
    erase_room(id);
    spdlog::info("[RoomDirectory] Deleted custom room {}", id);
}

void RoomDirectory::erase_room(const RoomId &id) {
    m_log.delete_room_data(id);
    {
        auto lock = m_db.acquire();
        m_db.prepare("DELETE FROM rooms WHERE id = ?").bind(1, id).run();
    }
    m_registry.detach_room(id);
    std::lock_guard lock(m_mutex);
    m_rooms.erase(id);
}

std::vector<RoomId> RoomDirectory::expire_idle_custom_rooms(std::chrono::milliseconds max_idle) {
    std::vector<RoomId> candidates;
    {
        std::lock_guard lock(m_mutex);
        for(const auto &[id, room] : m_rooms){
            if(room.is_custom) candidates.push_back(id);
        }
    }
    std::vector<RoomId> expired;
    for(const auto &id : candidates){
        auto guard = m_registry.serialize(id);
        if(!guard) continue;
        auto last_activity = m_registry.last_activity(id);
        if(m_registry.player_count(id) > 0 || !last_activity) continue;
        if(m_clock() - *last_activity <= max_idle.count()) continue;
        try{
            erase_room(id);
            expired.push_back(id);
            spdlog::info("[RoomDirectory] Expired idle custom room {}", id);
        }catch(const PersistenceError &e){
            spdlog::error("[RoomDirectory] Could not expire room {}: {}", id, e.what());
        }
    }
    return expired;
}
