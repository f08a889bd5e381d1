#pragma once
#include <functional>
#include <map>
#include <mutex>

#include "mailbox-store.hpp"

namespace sdrop {
// process local store, shared by every client holding it
class MemoryMailbox : public MailboxStore {
  private:
    std::mutex                               lock;
    std::map<std::string, Room, std::less<>> rooms;
    std::function<std::string()>             generate_room_id;

    auto find_room(std::string_view room_id) -> Room*;

  public:
    auto create_room(const PeerInfo& creator) -> std::expected<std::string, Error> override;
    auto read_room(std::string_view room_id) -> std::expected<Room, Error> override;
    auto read_messages(std::string_view room_id, uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> override;
    auto append_peer(std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> override;
    auto append_message(std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> override;
    auto mark_processed(std::string_view room_id, uint64_t seq, std::string_view peer_id) -> std::expected<void, Error> override;

    // room ids come from generate_id() unless overridden
    MemoryMailbox(std::function<std::string()> generate_room_id = {});
};
} // namespace sdrop
