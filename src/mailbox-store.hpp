#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "room.hpp"

namespace sdrop {
// shared storage of rooms
// implementations must be safe against concurrent writers, an append never hides another append
class MailboxStore {
  public:
    virtual auto create_room(const PeerInfo& creator) -> std::expected<std::string, Error> = 0;
    virtual auto read_room(std::string_view room_id) -> std::expected<Room, Error>         = 0;

    // entries with seq >= from_seq, ascending
    virtual auto read_messages(std::string_view room_id, uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> = 0;

    // no-op if the peer is already a member
    virtual auto append_peer(std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> = 0;

    // returns the seq assigned to the entry
    virtual auto append_message(std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> = 0;

    // adds peer_id to the processed set of the entry
    virtual auto mark_processed(std::string_view room_id, uint64_t seq, std::string_view peer_id) -> std::expected<void, Error> = 0;

    virtual ~MailboxStore() {}
};
} // namespace sdrop
