#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common.hpp"
#include "config.hpp"
#include "room/player.hpp"

// Records every frame it is handed, parsed back into JSON.
class RecordingConnection : public PlayerConnection {
public:
    void deliver(const std::string &message) override {
        std::lock_guard lock(m_mutex);
        m_frames.push_back(nlohmann::json::parse(message));
    }

    std::vector<nlohmann::json> frames() const {
        std::lock_guard lock(m_mutex);
        return m_frames;
    }

    std::vector<nlohmann::json> of_type(const std::string &type) const {
        std::vector<nlohmann::json> result;
        for(const auto &frame : frames()){
            if(frame.value("type", "") == type) result.push_back(frame);
        }
        return result;
    }

    nlohmann::json last() const {
        std::lock_guard lock(m_mutex);
        return m_frames.empty() ? nlohmann::json() : m_frames.back();
    }

    void clear() {
        std::lock_guard lock(m_mutex);
        m_frames.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<nlohmann::json> m_frames;
};

struct ManualClock {
    Timestamp now = 1'000;

    Clock clock() {
        return [this]{ return now; };
    }
};

inline Config test_config() {
    Config config;
    config.db_path = ":memory:";
    return config;
}
