#include "server.hpp"
#include "room_member.hpp"
#include <memory>
#include <thread>
#include <spdlog/spdlog.h>

Server::Server(Config config)
    : m_engine(std::move(config)){
}

RoomSynchronizationEngine &Server::engine(){
    return m_engine;
}

net::awaitable<void> Server::send_bad_response(
    beast::tcp_stream stream,
    const http::request<http::string_body> &req,
    http::status status,
    std::string body_text
    ){
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "RoomSyncServer");
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(false);
    res.body() = std::move(body_text);
    res.prepare_payload();
    co_await http::async_write(stream, res, net::use_awaitable);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<void> Server::run_session(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    http::request<http::string_body> req;
    beast::flat_buffer buffer;

    co_await http::async_read(stream, buffer, req, net::use_awaitable);
    if(!websocket::is_upgrade(req)) {
        co_return co_await send_bad_response(std::move(stream), req, http::status::upgrade_required, "websocket upgrade required");
    }
    auto room_member = std::make_shared<RoomMember>(
        websocket::stream<beast::tcp_stream>(std::move(stream)),
        m_engine);
    co_await room_member->run(std::move(req));
}

net::awaitable<void> Server::listener(unsigned short port){
    auto executor = co_await net::this_coro::executor;
    co_await listener(tcp::acceptor(executor, tcp::endpoint(tcp::v4(), port)));
}

net::awaitable<void> Server::listener(tcp::acceptor acceptor){
    spdlog::info("Server is listening port {}", acceptor.local_endpoint().port());
    auto executor = co_await net::this_coro::executor;
    for(;;){
        auto socket = co_await acceptor.async_accept(net::make_strand(executor), net::use_awaitable);
        // the session coroutine, its write loop and beast's timers share the socket's strand
        auto session_executor = socket.get_executor();
        net::co_spawn(
            session_executor,
            run_session(std::move(socket)),
            LogOnCatch("run_session")
            );
    }
}

void Server::start(Config config){
    auto num_threads = config.num_threads;
    auto port = config.port;
    // declared before the server so the engine's tasks are cancelled while it is alive
    net::io_context ioc(static_cast<int>(num_threads));
    Server server(std::move(config));
    server.m_engine.initialize();

    server.m_engine.start_background_tasks(ioc.get_executor());

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int){
        if(ec) return;
        spdlog::info("Shutting down...");
        server.m_engine.stop();
        try{
            server.m_engine.flush_storage();
        }catch(const std::exception &e){
            spdlog::error("Final flush failed: {}", e.what());
        }
        ioc.stop();
    });

    std::vector<std::jthread> runners;
    runners.reserve(num_threads-1);
    net::co_spawn(
        ioc,
        server.listener(port),
        LogOnCatch("listener"));

    for(std::size_t i{};i<num_threads-1;++i){
        runners.emplace_back([&ioc]{ioc.run();});
    }
    ioc.run();
}
