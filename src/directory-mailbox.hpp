#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include "mailbox-store.hpp"

namespace sdrop {
// store on a directory shared by independent processes
//
// <root>/<room>/room.json            room info
//              /peers/<n>.json       roster, in join order
//              /members/<peer>       roster membership marker
//              /messages/<seq>.json  log entry body
//              /processed/<seq>.<peer>
//              /tmp/                 staging area
//
// records are staged in tmp/ and published with a hard link, which fails if the name is taken.
// so a writer never replaces a record and a reader never sees a partial one.
class DirectoryMailbox : public MailboxStore {
  private:
    std::filesystem::path                       root;
    std::mutex                                  hints_lock;
    std::map<std::filesystem::path, uint64_t>   next_free_hints;

    auto room_dir(std::string_view room_id) const -> std::filesystem::path;
    auto check_room(std::string_view room_id) const -> std::optional<Error>;
    auto stage(const std::filesystem::path& room, std::string_view content) -> std::optional<std::filesystem::path>;
    auto publish(const std::filesystem::path& room, const std::filesystem::path& dir, std::string_view content) -> std::optional<uint64_t>;
    auto read_processed(const std::filesystem::path& room) const -> std::optional<std::multimap<uint64_t, std::string>>;

  public:
    auto create_room(const PeerInfo& creator) -> std::expected<std::string, Error> override;
    auto read_room(std::string_view room_id) -> std::expected<Room, Error> override;
    auto read_messages(std::string_view room_id, uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> override;
    auto append_peer(std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> override;
    auto append_message(std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> override;
    auto mark_processed(std::string_view room_id, uint64_t seq, std::string_view peer_id) -> std::expected<void, Error> override;

    DirectoryMailbox(std::filesystem::path root);
};
} // namespace sdrop
