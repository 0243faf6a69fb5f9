#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include "room/connection_registry.hpp"
#include "test_support.hpp"

namespace {

class ConnectionRegistryTest : public ::testing::Test {
protected:
    Player player(const std::string &id, const std::shared_ptr<PlayerConnection> &connection = nullptr) {
        return Player{.player_id = id, .player_name = "name-" + id, .connection = connection};
    }

    ManualClock clock;
    ConnectionRegistry registry{clock.clock()};
};

}

TEST_F(ConnectionRegistryTest, UnknownRoomIsRejected) {
    EXPECT_EQ(registry.add_player("missing", player("a")), AddPlayerResult::RoomUnavailable);
    EXPECT_TRUE(registry.list_players("missing").empty());
    EXPECT_FALSE(registry.serialize("missing"));
}

TEST_F(ConnectionRegistryTest, AddPlayerRespectsCapacity) {
    registry.attach_room("r", 2);
    EXPECT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    EXPECT_EQ(registry.add_player("r", player("b")), AddPlayerResult::Added);
    EXPECT_EQ(registry.add_player("r", player("c")), AddPlayerResult::RoomFull);

    auto players = registry.list_players("r");
    ASSERT_EQ(players.size(), 2u);
    for(const auto &p : players){
        EXPECT_NE(p.player_id, "c");
    }
    EXPECT_FALSE(registry.room_of("c"));
}

TEST_F(ConnectionRegistryTest, SamePlayerReplacesConnectionWithoutUsingCapacity) {
    registry.attach_room("r", 1);
    auto old_connection = std::make_shared<RecordingConnection>();
    auto new_connection = std::make_shared<RecordingConnection>();
    ASSERT_EQ(registry.add_player("r", player("a", old_connection)), AddPlayerResult::Added);
    EXPECT_EQ(registry.add_player("r", player("a", new_connection)), AddPlayerResult::Added);

    auto players = registry.list_players("r");
    ASSERT_EQ(players.size(), 1u);
    EXPECT_EQ(players[0].connection.lock(), new_connection);

    // the stale connection closing must not evict the new one
    EXPECT_FALSE(registry.remove_player("r", "a", old_connection.get()));
    EXPECT_EQ(registry.player_count("r"), 1u);
    EXPECT_TRUE(registry.remove_player("r", "a", new_connection.get()));
    EXPECT_EQ(registry.player_count("r"), 0u);
}

TEST_F(ConnectionRegistryTest, PlayerIsInAtMostOneRoom) {
    registry.attach_room("r1", 4);
    registry.attach_room("r2", 4);
    ASSERT_EQ(registry.add_player("r1", player("a")), AddPlayerResult::Added);
    EXPECT_EQ(registry.add_player("r2", player("a")), AddPlayerResult::InOtherRoom);
    EXPECT_EQ(registry.room_of("a"), "r1");

    ASSERT_TRUE(registry.remove_player("r1", "a"));
    EXPECT_EQ(registry.add_player("r2", player("a")), AddPlayerResult::Added);
    EXPECT_EQ(registry.room_of("a"), "r2");
}

TEST_F(ConnectionRegistryTest, RemoveMissingPlayerReturnsFalse) {
    registry.attach_room("r", 4);
    EXPECT_FALSE(registry.remove_player("r", "ghost"));
    EXPECT_FALSE(registry.remove_player("missing", "ghost"));
}

TEST_F(ConnectionRegistryTest, RemoveUpdatesLastActivity) {
    registry.attach_room("r", 4);
    EXPECT_EQ(registry.last_activity("r"), 1'000);
    ASSERT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    clock.now = 5'000;
    ASSERT_TRUE(registry.remove_player("r", "a"));
    EXPECT_EQ(registry.last_activity("r"), 5'000);
    clock.now = 6'000;
    registry.touch("r");
    EXPECT_EQ(registry.last_activity("r"), 6'000);
}

TEST_F(ConnectionRegistryTest, ListPlayersReturnsIndependentCopy) {
    registry.attach_room("r", 4);
    ASSERT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    auto players = registry.list_players("r");
    ASSERT_EQ(registry.add_player("r", player("b")), AddPlayerResult::Added);
    ASSERT_TRUE(registry.remove_player("r", "a"));
    ASSERT_EQ(players.size(), 1u);
    EXPECT_EQ(players[0].player_id, "a");
}

TEST_F(ConnectionRegistryTest, DrawingFlag) {
    registry.attach_room("r", 4);
    ASSERT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    registry.set_drawing_flag("r", "a", true);
    EXPECT_TRUE(registry.list_players("r")[0].is_drawing);
    registry.set_drawing_flag("r", "a", false);
    EXPECT_FALSE(registry.list_players("r")[0].is_drawing);

    EXPECT_NO_THROW(registry.set_drawing_flag("r", "gone", true));
    EXPECT_NO_THROW(registry.set_drawing_flag("missing", "a", true));
}

TEST_F(ConnectionRegistryTest, DetachedRoomDropsPlayersAndRejectsJoins) {
    registry.attach_room("r", 4);
    ASSERT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    registry.detach_room("r");
    EXPECT_FALSE(registry.has_room("r"));
    EXPECT_EQ(registry.add_player("r", player("b")), AddPlayerResult::RoomUnavailable);
    EXPECT_FALSE(registry.room_of("a"));
    EXPECT_EQ(registry.player_count("r"), 0u);
}

TEST_F(ConnectionRegistryTest, ReattachUpdatesCapacityAndKeepsPlayers) {
    registry.attach_room("r", 1);
    ASSERT_EQ(registry.add_player("r", player("a")), AddPlayerResult::Added);
    registry.attach_room("r", 3);
    EXPECT_EQ(registry.player_count("r"), 1u);
    EXPECT_EQ(registry.add_player("r", player("b")), AddPlayerResult::Added);
}

TEST_F(ConnectionRegistryTest, ConcurrentJoinsNeverExceedCapacity) {
    constexpr std::size_t capacity = 4;
    constexpr int contenders = 32;
    for(int round = 0; round < 20; ++round){
        auto room = "r" + std::to_string(round);
        registry.attach_room(room, capacity);

        std::atomic<int> admitted{0};
        std::vector<std::thread> threads;
        for(int i = 0; i < contenders; ++i){
            threads.emplace_back([&, i]{
                if(registry.add_player(room, player(room + "-p" + std::to_string(i))) == AddPlayerResult::Added) ++admitted;
                EXPECT_LE(registry.list_players(room).size(), capacity);
            });
        }
        for(auto &t : threads) t.join();

        EXPECT_EQ(admitted.load(), static_cast<int>(capacity));
        EXPECT_EQ(registry.list_players(room).size(), capacity);
    }
}

TEST_F(ConnectionRegistryTest, SerializeExcludesOtherHolders) {
    registry.attach_room("r", 4);
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};
    std::vector<std::thread> threads;
    for(int i = 0; i < 8; ++i){
        threads.emplace_back([&]{
            for(int n = 0; n < 100; ++n){
                auto guard = registry.serialize("r");
                ASSERT_TRUE(guard);
                int now = ++inside;
                int seen = max_inside.load();
                while(now > seen && !max_inside.compare_exchange_weak(seen, now)){}
                --inside;
            }
        });
    }
    for(auto &t : threads) t.join();
    EXPECT_EQ(max_inside.load(), 1);
}
