#include <algorithm>

#include "ids.hpp"
#include "macros/logger.hpp"
#include "memory-mailbox.hpp"

namespace {
auto logger = Logger("sdrop_memory_mailbox");
}

namespace sdrop {
auto MemoryMailbox::find_room(const std::string_view room_id) -> Room* {
    const auto i = rooms.find(room_id);
    return i != rooms.end() ? &i->second : nullptr;
}

auto MemoryMailbox::create_room(const PeerInfo& creator) -> std::expected<std::string, Error> {
    if(!is_valid_id(creator.id)) {
        return std::unexpected(Error::InvalidId);
    }

    auto guard = std::lock_guard(lock);
    auto id    = std::string();
    for(auto attempt = 0;; attempt += 1) {
        if(attempt == 16) {
            LOG_ERROR(logger, "could not find a free room id");
            return std::unexpected(Error::StoreUnavailable);
        }
        id = generate_room_id ? generate_room_id() : generate_id();
        if(!is_valid_id(id)) {
            LOG_ERROR(logger, "room id generator returned an invalid id {}", id);
            return std::unexpected(Error::InvalidId);
        }
        if(!rooms.contains(id)) {
            break;
        }
    }

    auto room = Room{
        .info = {
            .id           = id,
            .creator_id   = creator.id,
            .creator_name = creator.name,
            .created_at   = now_millis(),
        },
        .peers    = {creator},
        .messages = {},
    };
    rooms.emplace(id, std::move(room));
    LOG_DEBUG(logger, "room {} created by {}", id, creator.id);
    return id;
}

auto MemoryMailbox::read_room(const std::string_view room_id) -> std::expected<Room, Error> {
    auto guard = std::lock_guard(lock);
    if(const auto room = find_room(room_id); room != nullptr) {
        return *room;
    }
    return std::unexpected(Error::RoomNotFound);
}

auto MemoryMailbox::read_messages(const std::string_view room_id, const uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> {
    auto       guard = std::lock_guard(lock);
    const auto room  = find_room(room_id);
    if(room == nullptr) {
        return std::unexpected(Error::RoomNotFound);
    }
    // seq equals index, the log never has holes
    auto ret = std::vector<LogEntry>();
    for(auto i = from_seq; i < room->messages.size(); i += 1) {
        ret.push_back(room->messages[i]);
    }
    return ret;
}

auto MemoryMailbox::append_peer(const std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> {
    if(!is_valid_id(peer.id)) {
        return std::unexpected(Error::InvalidId);
    }

    auto       guard = std::lock_guard(lock);
    const auto room  = find_room(room_id);
    if(room == nullptr) {
        return std::unexpected(Error::RoomNotFound);
    }
    if(std::ranges::find(room->peers, peer.id, &PeerInfo::id) == room->peers.end()) {
        room->peers.push_back(peer);
    }
    return {};
}

auto MemoryMailbox::append_message(const std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> {
    auto       guard = std::lock_guard(lock);
    const auto room  = find_room(room_id);
    if(room == nullptr) {
        return std::unexpected(Error::RoomNotFound);
    }
    const auto seq = uint64_t(room->messages.size());
    room->messages.push_back(LogEntry{.seq = seq, .body = std::move(body), .processed_by = {}});
    return seq;
}

auto MemoryMailbox::mark_processed(const std::string_view room_id, const uint64_t seq, const std::string_view peer_id) -> std::expected<void, Error> {
    auto       guard = std::lock_guard(lock);
    const auto room  = find_room(room_id);
    if(room == nullptr) {
        return std::unexpected(Error::RoomNotFound);
    }
    if(seq >= room->messages.size()) {
        LOG_WARN(logger, "mark_processed for unknown seq {} in room {}", seq, room_id);
        return {};
    }
    auto& processed = room->messages[seq].processed_by;
    if(std::ranges::find(processed, peer_id) == processed.end()) {
        processed.emplace_back(peer_id);
    }
    return {};
}

MemoryMailbox::MemoryMailbox(std::function<std::string()> generate_room_id)
    : generate_room_id(std::move(generate_room_id)) {
}
} // namespace sdrop
