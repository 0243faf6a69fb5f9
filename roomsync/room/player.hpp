#pragma once
#include <memory>
#include <string>
#include "storage/records.hpp"

// Outbound side of one client connection.
class PlayerConnection {
public:
    virtual ~PlayerConnection() = default;
    // Queues a frame; never blocks and never reports failure.
    virtual void deliver(const std::string &message) = 0;
};

struct Player {
    PlayerId player_id;
    std::string player_name;
    std::weak_ptr<PlayerConnection> connection; // connection owns itself, registry only observes
    bool is_drawing = false;
};
