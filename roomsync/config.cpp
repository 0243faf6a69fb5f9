#include "config.hpp"
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

namespace {

template<typename T>
std::optional<T> parse_number(const char* name, const char* value) {
    std::string_view text(value);
    T result{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if(ec != std::errc{} || ptr != text.data() + text.size()){
        spdlog::warn("Ignoring malformed value '{}' for {}", text, name);
        return std::nullopt;
    }
    return result;
}

template<typename T>
void read_number(const std::function<const char*(const char*)>& lookup, const char* name, T& target) {
    const char* value = lookup(name);
    if(!value || !*value) return;
    if(auto parsed = parse_number<T>(name, value)){
        target = *parsed;
    }
}

void read_seconds(const std::function<const char*(const char*)>& lookup, const char* name, std::chrono::seconds& target) {
    long long count = target.count();
    read_number(lookup, name, count);
    target = std::chrono::seconds{count};
}

}

Config Config::from_env(const std::function<const char*(const char*)>& lookup) {
    Config config;
    read_number(lookup, "PORT", config.port);
    read_number(lookup, "ROOMSYNC_PORT", config.port);
    read_number(lookup, "ROOMSYNC_THREADS", config.num_threads);
    if(const char* path = lookup("ROOMSYNC_DB_PATH"); path && *path){
        config.db_path = path;
    }
    if(const char* level = lookup("ROOMSYNC_LOG_LEVEL"); level && *level){
        config.log_level = level;
    }
    read_number(lookup, "ROOMSYNC_MAX_PLAYERS", config.max_players);
    read_number(lookup, "ROOMSYNC_CHAT_HISTORY", config.chat_history_limit);
    read_number(lookup, "ROOMSYNC_ROOM_NAME_MAX", config.room_name_max);
    read_seconds(lookup, "ROOMSYNC_FLUSH_INTERVAL_S", config.flush_interval);
    read_seconds(lookup, "ROOMSYNC_MAINTENANCE_INTERVAL_S", config.maintenance_interval);
    read_seconds(lookup, "ROOMSYNC_ROOM_IDLE_S", config.room_idle);
    read_seconds(lookup, "ROOMSYNC_RETENTION_S", config.retention);
    if(config.num_threads == 0) config.num_threads = 1;
    if(config.max_players == 0){
        spdlog::warn("ROOMSYNC_MAX_PLAYERS must be positive, using 4");
        config.max_players = 4;
    }
    return config;
}

Config Config::from_env() {
    return from_env([](const char* name) -> const char* { return std::getenv(name); });
}
