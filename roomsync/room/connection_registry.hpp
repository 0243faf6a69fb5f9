#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "common.hpp"
#include "room/player.hpp"

enum class AddPlayerResult { Added, RoomUnavailable, RoomFull, InOtherRoom };

// Live player sets per room and the per-room serialization lock.
//
// Each attached room owns two mutexes: the serialization lock, which callers
// take through `serialize()` around a whole join/append/broadcast sequence,
// and an internal state lock guarding the player map. The state lock makes
// add_player's capacity check-and-set atomic even without serialization.
class ConnectionRegistry {
    struct RoomSlot;
public:
    class RoomLock {
    public:
        RoomLock(std::shared_ptr<RoomSlot> slot);
    private:
        std::shared_ptr<RoomSlot> m_slot;
        std::unique_lock<std::mutex> m_lock;
    };

    explicit ConnectionRegistry(Clock clock);

    void attach_room(const RoomId &room_id, std::size_t max_players);
    // Marks the room dead; later joins fail, existing players are dropped.
    void detach_room(const RoomId &room_id);
    bool has_room(const RoomId &room_id) const;

    std::optional<RoomLock> serialize(const RoomId &room_id);

    // A player already in this room gets its connection replaced without using capacity.
    AddPlayerResult add_player(const RoomId &room_id, Player player);
    // With `connection` set, only removes the entry if it still belongs to that handle.
    bool remove_player(const RoomId &room_id, const PlayerId &player_id,
                       const PlayerConnection *connection = nullptr);
    // Copy of the current set; safe to iterate without any lock.
    std::vector<Player> list_players(const RoomId &room_id) const;
    void set_drawing_flag(const RoomId &room_id, const PlayerId &player_id, bool is_drawing);

    std::size_t player_count(const RoomId &room_id) const;
    std::optional<RoomId> room_of(const PlayerId &player_id) const;

    void touch(const RoomId &room_id);
    std::optional<Timestamp> last_activity(const RoomId &room_id) const;

private:
    struct RoomSlot {
        std::mutex serial_mutex;
        mutable std::mutex state_mutex;
        std::size_t max_players{};
        bool is_dead = false;
        Timestamp last_activity{};
        std::unordered_map<PlayerId, Player> players;
    };

    std::shared_ptr<RoomSlot> find(const RoomId &room_id) const;

    Clock m_clock;
    mutable std::mutex m_mutex;
    std::unordered_map<RoomId, std::shared_ptr<RoomSlot>> m_rooms;
    // lock order: RoomSlot::state_mutex, then m_index_mutex
    mutable std::mutex m_index_mutex;
    std::unordered_map<PlayerId, RoomId> m_player_rooms;
};
