#include <gtest/gtest.h>
#include <limits>
#include <map>
#include "errors.hpp"
#include "storage/database.hpp"
#include "storage/event_log.hpp"

namespace {

constexpr Timestamp beginning = std::numeric_limits<Timestamp>::min();

class EventLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        add_room("room-1");
        add_room("room-2");
    }

    void add_room(const std::string &id) {
        db.prepare("INSERT INTO rooms (id, name, created_at, max_players, is_custom) VALUES (?, ?, 0, 4, 1)")
            .bind(1, id)
            .bind(2, id)
            .run();
    }

    EventId draw(const RoomId &room, Timestamp ts, nlohmann::json payload = {{"points", nlohmann::json::array()}}) {
        return log.append_drawing_event(room, "p1", "draw", payload, ts);
    }

    Database db{":memory:"};
    EventLog log{db};
};

// Toy canvas: each draw paints one cell, a snapshot is the serialized cell map.
using Canvas = std::map<int, std::string>;

void apply(Canvas &canvas, const DrawingEvent &event) {
    canvas[event.payload.at("cell").get<int>()] = event.payload.at("color").get<std::string>();
}

}

TEST_F(EventLogTest, AppendChatAssignsIncreasingIds) {
    auto first = log.append_chat("room-1", "p1", "Alice", "hello", 100);
    auto second = log.append_chat("room-1", "p1", "Alice", "again", 100);
    EXPECT_GT(second, first);
}

TEST_F(EventLogTest, AppendChatStoresTrimmedText) {
    log.append_chat("room-1", "p1", "Alice", "  hi there \n", 100);
    auto history = log.chat_history("room-1", 10);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].text, "hi there");
    EXPECT_EQ(history[0].player_name, "Alice");
    EXPECT_EQ(history[0].timestamp, 100);
}

TEST_F(EventLogTest, AppendChatRejectsEmptyText) {
    EXPECT_THROW(log.append_chat("room-1", "p1", "Alice", "", 100), ValidationError);
    EXPECT_THROW(log.append_chat("room-1", "p1", "Alice", "   \t ", 100), ValidationError);
    EXPECT_TRUE(log.chat_history("room-1", 10).empty());
}

TEST_F(EventLogTest, AppendChatLimitCountsCodePoints) {
    std::string accented;
    for(int i = 0; i < 140; ++i) accented += "\xC3\xA9"; // é, two bytes each
    EXPECT_NO_THROW(log.append_chat("room-1", "p1", "Alice", accented, 100));
    EXPECT_NO_THROW(log.append_chat("room-1", "p1", "Alice", std::string(140, 'x'), 101));
    EXPECT_THROW(log.append_chat("room-1", "p1", "Alice", std::string(141, 'x'), 102), ValidationError);
    EXPECT_EQ(log.chat_history("room-1", 10).size(), 2u);
}

TEST_F(EventLogTest, AppendToUnknownRoomThrowsNotFound) {
    EXPECT_THROW(log.append_chat("nope", "p1", "Alice", "hi", 100), NotFoundError);
    EXPECT_THROW(draw("nope", 100), NotFoundError);
}

TEST_F(EventLogTest, DrawingPayloadMustBeObject) {
    EXPECT_THROW(log.append_drawing_event("room-1", "p1", "draw", nlohmann::json::array(), 100), ValidationError);
    EXPECT_THROW(log.append_drawing_event("room-1", "p1", "draw", "text", 100), ValidationError);
    EXPECT_TRUE(log.drawing_events_since("room-1", beginning).empty());
}

TEST_F(EventLogTest, ChatHistoryReturnsMostRecentInChronologicalOrder) {
    log.append_chat("room-1", "p1", "Alice", "one", 100);
    log.append_chat("room-1", "p2", "Bob", "two", 200);
    log.append_chat("room-1", "p1", "Alice", "three", 300);
    log.append_chat("room-2", "p3", "Carol", "elsewhere", 400);

    auto history = log.chat_history("room-1", 2);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].text, "two");
    EXPECT_EQ(history[1].text, "three");
}

TEST_F(EventLogTest, DrawingEventsSinceIsStrictlyGreater) {
    draw("room-1", 100);
    draw("room-1", 150);
    draw("room-1", 200);

    auto events = log.drawing_events_since("room-1", 150);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].timestamp, 200);
    EXPECT_EQ(log.drawing_events_since("room-1", 99).size(), 3u);
    EXPECT_TRUE(log.drawing_events_since("room-1", 200).empty());
}

TEST_F(EventLogTest, DrawingEventsOrderedByTimestampThenId) {
    auto late = draw("room-1", 300, {{"n", 1}});
    auto early_a = draw("room-1", 100, {{"n", 2}});
    auto early_b = draw("room-1", 100, {{"n", 3}});

    auto events = log.drawing_events_since("room-1", beginning);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].id, early_a);
    EXPECT_EQ(events[1].id, early_b);
    EXPECT_EQ(events[2].id, late);
    EXPECT_EQ(events[1].payload.at("n"), 3);
    EXPECT_EQ(events[1].event_type, "draw");
    EXPECT_EQ(events[1].player_id, "p1");
}

TEST_F(EventLogTest, RoomsDoNotSeeEachOthersEvents) {
    draw("room-1", 100);
    draw("room-2", 100);
    log.append_chat("room-2", "p1", "Alice", "hi", 100);
    EXPECT_EQ(log.drawing_events_since("room-1", beginning).size(), 1u);
    EXPECT_TRUE(log.chat_history("room-1", 10).empty());
}

TEST_F(EventLogTest, SaveSnapshotReplacesPrevious) {
    EXPECT_FALSE(log.snapshot("room-1"));
    log.save_snapshot("room-1", "first", 100);
    log.save_snapshot("room-1", "second", 200);

    auto snapshot = log.snapshot("room-1");
    ASSERT_TRUE(snapshot);
    EXPECT_EQ(snapshot->data, "second");
    EXPECT_EQ(snapshot->timestamp, 200);

    auto count = db.prepare("SELECT COUNT(*) FROM canvas_snapshots WHERE room_id = 'room-1'");
    ASSERT_TRUE(count.step());
    EXPECT_EQ(count.column_int(0), 1);
}

TEST_F(EventLogTest, SaveSnapshotKeepsPersistedHistory) {
    draw("room-1", 100);
    draw("room-1", 200);
    log.save_snapshot("room-1", "canvas", 300);
    EXPECT_EQ(log.drawing_events_since("room-1", beginning).size(), 2u);
}

TEST_F(EventLogTest, CompactionWithoutSnapshotKeepsDrawingEvents) {
    draw("room-1", 100);
    log.append_chat("room-1", "p1", "Alice", "old", 100);
    log.append_chat("room-1", "p1", "Alice", "new", 600);

    auto result = log.compaction_pass("room-1", 500);
    EXPECT_FALSE(result.drawing_compacted);
    EXPECT_EQ(result.drawing_events_removed, 0u);
    EXPECT_EQ(result.chat_messages_removed, 1u);
    EXPECT_EQ(log.drawing_events_since("room-1", beginning).size(), 1u);
    ASSERT_EQ(log.chat_history("room-1", 10).size(), 1u);
    EXPECT_EQ(log.chat_history("room-1", 10)[0].text, "new");
}

TEST_F(EventLogTest, CompactionWithOlderSnapshotKeepsDrawingEvents) {
    draw("room-1", 100);
    draw("room-1", 400);
    log.save_snapshot("room-1", "canvas", 300);

    auto result = log.compaction_pass("room-1", 500);
    EXPECT_FALSE(result.drawing_compacted);
    EXPECT_EQ(log.drawing_events_since("room-1", beginning).size(), 2u);
}

TEST_F(EventLogTest, CompactionWithCoveringSnapshotRemovesOnlyOlderEvents) {
    draw("room-1", 100);
    draw("room-1", 200);
    draw("room-1", 300);
    draw("room-1", 400);
    draw("room-2", 100);
    log.save_snapshot("room-1", "canvas", 300);

    auto result = log.compaction_pass("room-1", 300);
    EXPECT_TRUE(result.drawing_compacted);
    EXPECT_EQ(result.drawing_events_removed, 2u);

    auto remaining = log.drawing_events_since("room-1", beginning);
    ASSERT_EQ(remaining.size(), 2u);
    EXPECT_EQ(remaining[0].timestamp, 300);
    EXPECT_EQ(remaining[1].timestamp, 400);
    EXPECT_EQ(log.drawing_events_since("room-2", beginning).size(), 1u);
}

TEST_F(EventLogTest, SnapshotPlusSuffixReproducesFullReplay) {
    const std::vector<std::pair<int, std::string>> strokes = {
        {1, "red"}, {2, "blue"}, {1, "green"}, {3, "black"}, {2, "white"}, {4, "red"},
    };
    Timestamp ts = 100;
    Canvas at_snapshot;
    Timestamp snapshot_ts = 0;
    for(std::size_t i = 0; i < strokes.size(); ++i){
        draw("room-1", ts, {{"cell", strokes[i].first}, {"color", strokes[i].second}});
        if(i == 2){
            for(const auto &event : log.drawing_events_since("room-1", beginning)) apply(at_snapshot, event);
            snapshot_ts = ts;
            log.save_snapshot("room-1", nlohmann::json(at_snapshot).dump(), snapshot_ts);
        }
        ts += 50;
    }

    Canvas full;
    for(const auto &event : log.drawing_events_since("room-1", beginning)) apply(full, event);

    auto check = [&]{
        auto snapshot = log.snapshot("room-1");
        ASSERT_TRUE(snapshot);
        auto rebuilt = nlohmann::json::parse(snapshot->data).get<Canvas>();
        for(const auto &event : log.drawing_events_since("room-1", snapshot->timestamp)) apply(rebuilt, event);
        EXPECT_EQ(rebuilt, full);
    };
    check();
    log.compaction_pass("room-1", snapshot_ts);
    check();
}

TEST_F(EventLogTest, ClearDrawingStateDropsEventsAndSnapshot) {
    draw("room-1", 100);
    log.save_snapshot("room-1", "canvas", 150);
    log.append_chat("room-1", "p1", "Alice", "stays", 160);

    log.clear_drawing_state("room-1");
    EXPECT_TRUE(log.drawing_events_since("room-1", beginning).empty());
    EXPECT_FALSE(log.snapshot("room-1"));
    EXPECT_EQ(log.chat_history("room-1", 10).size(), 1u);
}

TEST_F(EventLogTest, ClearChatHistory) {
    log.append_chat("room-1", "p1", "Alice", "bye", 100);
    log.clear_chat_history("room-1");
    EXPECT_TRUE(log.chat_history("room-1", 10).empty());
}

TEST_F(EventLogTest, DeleteRoomDataOnlyTouchesThatRoom) {
    draw("room-1", 100);
    draw("room-2", 100);
    log.save_snapshot("room-1", "canvas", 100);
    log.append_chat("room-1", "p1", "Alice", "hi", 100);

    log.delete_room_data("room-1");
    EXPECT_TRUE(log.drawing_events_since("room-1", beginning).empty());
    EXPECT_TRUE(log.chat_history("room-1", 10).empty());
    EXPECT_FALSE(log.snapshot("room-1"));
    EXPECT_EQ(log.drawing_events_since("room-2", beginning).size(), 1u);
}

TEST_F(EventLogTest, StorageFailureSurfacesAsPersistenceError) {
    db.execute("DROP TABLE chat_messages");
    EXPECT_THROW(log.append_chat("room-1", "p1", "Alice", "hi", 100), PersistenceError);
    EXPECT_NO_THROW(draw("room-1", 100));
}

TEST_F(EventLogTest, FlushOnMemoryDatabaseIsNoop) {
    EXPECT_NO_THROW(log.flush());
}
