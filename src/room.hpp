#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sdrop {
struct PeerInfo {
    std::string id;
    std::string name;
};

// one record of a room's message log
// body is opaque to the store
struct LogEntry {
    uint64_t                 seq;
    std::string              body;
    std::vector<std::string> processed_by;
};

struct RoomInfo {
    std::string id;
    std::string creator_id;
    std::string creator_name;
    int64_t     created_at;
};

struct Room {
    RoomInfo              info;
    std::vector<PeerInfo> peers;    // append order, unique by id
    std::vector<LogEntry> messages; // ascending seq
};
} // namespace sdrop
