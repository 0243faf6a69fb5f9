#pragma once

#include "common.hpp"
#include <memory>
#include <deque>
#include "room/player.hpp"
#include "sync/engine.hpp"

// One WebSocket client. Reads frames into the engine and owns the outbound queue.
class RoomMember : public PlayerConnection, public std::enable_shared_from_this<RoomMember> {
public:
    using Connection = beast::websocket::stream<beast::tcp_stream>;
    RoomMember(Connection connection, RoomSynchronizationEngine &engine);

    RoomMember(const RoomMember&) = delete;
    RoomMember& operator=(const RoomMember&) = delete;

    void deliver(const std::string &message) override;
    net::awaitable<void> run(http::request<http::string_body> req);

private:
    void send_impl(std::string message);
    net::awaitable<void> write_loop(std::shared_ptr<RoomMember> self);

    Connection m_connection;
    RoomSynchronizationEngine &m_engine; // engine outlives every session
    ConnectionState m_state;

    bool m_is_writing = false;
    std::deque<std::string> m_write_queue;
};
