#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

struct Config {
    unsigned short port = 5000;
    std::size_t num_threads = 4;
    std::string db_path = "data/roomsync.db";
    std::string log_level = "info";

    std::size_t max_players = 4;
    std::size_t chat_history_limit = 50;
    std::size_t room_name_max = 20;

    std::chrono::seconds flush_interval{30};
    std::chrono::seconds maintenance_interval{3600};
    std::chrono::seconds room_idle{24 * 60 * 60};
    std::chrono::seconds retention{7 * 24 * 60 * 60};

    // Reads ROOMSYNC_* variables through `lookup`; unset or malformed values keep the default.
    static Config from_env(const std::function<const char*(const char*)>& lookup);
    static Config from_env();
};
