#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include "room/connection_registry.hpp"
#include "storage/database.hpp"
#include "storage/event_log.hpp"

// Room metadata and lifecycle. Metadata lives in the `rooms` relation and is
// cached here; live player counts always come from the ConnectionRegistry.
class RoomDirectory {
public:
    struct Options {
        std::size_t max_players = 4;
        std::size_t name_max = 20;
    };

    RoomDirectory(Database &db, EventLog &log, ConnectionRegistry &registry, Clock clock, Options options);

    // Loads persisted rooms and attaches them to the registry.
    void load();
    void ensure_default_rooms();

    // Re-creating an existing id only rewrites its metadata.
    RoomRecord create_room(const std::string &name, const RoomId &id, bool is_custom);
    RoomRecord create_custom_room(const std::string &name);

    std::optional<RoomRecord> get_room(const RoomId &id) const;
    std::optional<RoomInfo> room_info(const RoomId &id) const;
    // Built-in rooms first, then by name.
    std::vector<RoomInfo> list_rooms() const;
    std::vector<RoomId> room_ids() const;

    // Throws NotFoundError, PermissionError for built-in rooms, ConflictError while occupied.
    void delete_room(const RoomId &id);
    std::vector<RoomId> expire_idle_custom_rooms(std::chrono::milliseconds max_idle);

private:
    RoomInfo make_info(const RoomRecord &room) const;
    // Caller holds the room's serialization lock.
    void erase_room(const RoomId &id);

    Database &m_db;
    EventLog &m_log;
    ConnectionRegistry &m_registry;
    Clock m_clock;
    Options m_options;

    mutable std::mutex m_mutex;
    std::unordered_map<RoomId, RoomRecord> m_rooms;
    boost::uuids::random_generator m_uuid_gen;
};
