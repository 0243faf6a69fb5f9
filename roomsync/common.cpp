#include "common.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

Timestamp system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool session_ended(const boost::system::error_code& ec) {
    return
        ec == websocket::error::closed ||
        ec == net::error::connection_reset ||
        ec == net::error::eof ||
        ec == net::error::operation_aborted
        ;
}

std::string trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    auto first = text.find_first_not_of(whitespace);
    if(first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return std::string(text.substr(first, last - first + 1));
}

std::size_t utf8_length(std::string_view text) {
    std::size_t count{};
    for(unsigned char c : text){
        // continuation bytes are 10xxxxxx
        if((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

LogOnCatch::LogOnCatch(std::string source)
    :m_source(std::move(source)){
}
void LogOnCatch::operator()(std::exception_ptr e){
    if(e) try{
            std::rethrow_exception(e);
        }catch(std::exception &e){
            spdlog::error("Error in {}: {}", m_source, e.what());
        }
}
