#include "room_member.hpp"
#include <spdlog/spdlog.h>

namespace {
constexpr std::size_t max_frame_size = 16 * 1024 * 1024; // canvas snapshots are data URLs
}

RoomMember::RoomMember(Connection connection, RoomSynchronizationEngine &engine)
    : m_connection(std::move(connection)), m_engine(engine){
}

void RoomMember::deliver(const std::string &message){
    send_impl(message);
}

void RoomMember::send_impl(std::string message){
    net::post(
        m_connection.get_executor(),
        [self = shared_from_this(), message = std::move(message)]() mutable {
            self->m_write_queue.push_back(std::move(message));
            if(!self->m_is_writing){
                self->m_is_writing = true;
                auto executor = self->m_connection.get_executor();
                net::co_spawn(
                    executor,
                    self->write_loop(std::move(self)),
                    LogOnCatch("session write_loop")
                    );
            }
        });
}

net::awaitable<void> RoomMember::run(http::request<http::string_body> req){
    auto self = shared_from_this();
    m_connection.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    m_connection.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res){
            res.set(http::field::server, "RoomSyncServer");
        }));
    m_connection.read_message_max(max_frame_size);
    co_await m_connection.async_accept(req, net::use_awaitable);
    spdlog::info("[WS] New connection established");

    try {
        beast::flat_buffer buffer;
        for (;;) {
            co_await m_connection.async_read(buffer, net::use_awaitable);
            if(m_connection.got_text()){
                m_engine.handle_frame(m_state, self, beast::buffers_to_string(buffer.data()));
            }
            buffer.consume(buffer.size());
        }
    }
    catch (const boost::system::system_error& e) {
        if (!session_ended(e.code())) {
            spdlog::error("[WS] Connection error: {}", e.what());
        }
    }
    catch (const std::exception& e) {
        spdlog::error("[WS] Session aborted: {}", e.what());
    }
    if(!m_state.player_id.empty()){
        spdlog::info("[WS] Player {} ({}) disconnected", m_state.player_name, m_state.player_id);
    }
    m_engine.disconnect(m_state, this);
}

net::awaitable<void> RoomMember::write_loop(std::shared_ptr<RoomMember> self){
    try{
        while(!m_write_queue.empty()){
            const auto &msg = m_write_queue.front();
            co_await m_connection.async_write(net::buffer(msg), net::use_awaitable);
            m_write_queue.pop_front();
        }
    } catch(const boost::system::system_error &e) {
        // the read loop notices the broken connection and detaches the player
        m_write_queue.clear();
        if(!session_ended(e.code())){
            spdlog::debug("[WS] Write failed: {}", e.what());
        }
    }

    m_is_writing = false;
}
