#include "server.hpp"
#include <spdlog/spdlog.h>

int main() {
    auto config = Config::from_env();
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    try {
        Server::start(std::move(config));
    } catch (const std::exception &e) {
        spdlog::critical("Failed to start: {}", e.what());
        return 1;
    }
}
