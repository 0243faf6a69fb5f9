#pragma once
#include "common.hpp"
#include "config.hpp"
#include "sync/engine.hpp"

class Server{
public:
    using tcp = net::ip::tcp;

    net::awaitable<void> send_bad_response(
        beast::tcp_stream stream,
        const http::request<http::string_body> &req,
        http::status status,
        std::string body_text
    );

    net::awaitable<void> run_session(tcp::socket socket);
    net::awaitable<void> listener(unsigned short port);
    net::awaitable<void> listener(tcp::acceptor acceptor);

    explicit Server(Config config);
    RoomSynchronizationEngine &engine();

    static void start(Config config);
private:
    RoomSynchronizationEngine m_engine;
};
