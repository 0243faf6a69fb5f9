#pragma once
#include <boost/beast.hpp>
#include <boost/asio.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;

// Milliseconds since the unix epoch.
using Timestamp = std::int64_t;
using Clock = std::function<Timestamp()>;

Timestamp system_now_ms();

bool session_ended(const boost::system::error_code& ec);

std::string trim(std::string_view text);
// Number of UTF-8 code points; invalid lead bytes count as one each.
std::size_t utf8_length(std::string_view text);

class LogOnCatch{
public:
    LogOnCatch(std::string source);
    void operator()(std::exception_ptr e);
private:
    std::string m_source;
};
