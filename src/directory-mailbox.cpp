#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <fstream>

#include <json/json.h>

#include "directory-mailbox.hpp"
#include "ids.hpp"
#include "macros/logger.hpp"
#include "util/cleaner.hpp"
#include "util/file-io.hpp"
#include "util/span.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_directory_mailbox");
}

namespace sdrop {
namespace fs = std::filesystem;

namespace {
auto write_text(const fs::path& path, const std::string_view content) -> bool {
    auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
    ensure(file, "failed to open {}", path.string());
    file.write(content.data(), std::streamsize(content.size()));
    file.close();
    ensure(file, "failed to write {}", path.string());
    return true;
}

auto read_text(const fs::path& path) -> std::optional<std::string> {
    unwrap(bytes, read_file(path.c_str()), "failed to read {}", path.string());
    return from_span(bytes);
}

auto parse_json(const std::string_view text) -> std::optional<Json::Value> {
    auto       root    = Json::Value();
    auto       errors  = std::string();
    auto       builder = Json::CharReaderBuilder();
    const auto reader  = std::unique_ptr<Json::CharReader>(builder.newCharReader());
    try {
        ensure(reader->parse(text.data(), text.data() + text.size(), &root, &errors), "malformed record: {}", errors);
    } catch(const Json::Exception& e) {
        bail("malformed record: {}", e.what());
    }
    ensure(root.isObject(), "record is not an object");
    return root;
}

auto string_member(const Json::Value& record, const char* const key) -> std::optional<std::string> {
    const auto& value = record[key];
    ensure(value.isString(), "member {} is not a string", key);
    return value.asString();
}

auto to_json_text(const Json::Value& root) -> std::string {
    auto builder           = Json::StreamWriterBuilder();
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

auto parse_seq(const std::string_view text) -> std::optional<uint64_t> {
    auto value         = uint64_t();
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if(ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto record_name(const uint64_t seq) -> std::string {
    return std::format("{}.json", seq);
}

auto exists(const fs::path& path) -> bool {
    auto ec = std::error_code();
    return fs::exists(path, ec);
}

const auto room_subdirs = std::array{"peers", "members", "messages", "processed", "tmp"};
} // namespace

auto DirectoryMailbox::room_dir(const std::string_view room_id) const -> fs::path {
    return root / room_id;
}

auto DirectoryMailbox::check_room(const std::string_view room_id) const -> std::optional<Error> {
    if(!is_valid_id(room_id)) {
        return Error::InvalidId;
    }
    auto ec = std::error_code();
    if(!fs::is_directory(root, ec)) {
        LOG_WARN(logger, "mailbox directory {} is not available", root.string());
        return Error::StoreUnavailable;
    }
    if(!exists(room_dir(room_id) / "room.json")) {
        return Error::RoomNotFound;
    }
    return std::nullopt;
}

auto DirectoryMailbox::stage(const fs::path& room, const std::string_view content) -> std::optional<fs::path> {
    auto path = room / "tmp" / generate_id(16);
    ensure(write_text(path, content));
    return path;
}

auto DirectoryMailbox::publish(const fs::path& room, const fs::path& dir, const std::string_view content) -> std::optional<uint64_t> {
    unwrap(staged, stage(room, content));
    const auto cleaner = Cleaner{[&staged] {
        auto ec = std::error_code();
        fs::remove(staged, ec);
    }};

    auto seq = uint64_t(0);
    {
        auto guard = std::lock_guard(hints_lock);
        seq        = next_free_hints[dir];
    }
    for(;; seq += 1) {
        auto ec = std::error_code();
        fs::create_hard_link(staged, dir / record_name(seq), ec);
        if(!ec) {
            break;
        }
        ensure(ec == std::errc::file_exists, "failed to publish into {}: {}", dir.string(), ec.message());
    }
    {
        auto  guard = std::lock_guard(hints_lock);
        auto& hint  = next_free_hints[dir];
        hint        = std::max(hint, seq + 1);
    }
    return seq;
}

auto DirectoryMailbox::read_processed(const fs::path& room) const -> std::optional<std::multimap<uint64_t, std::string>> {
    auto ret = std::multimap<uint64_t, std::string>();
    auto ec  = std::error_code();
    for(const auto& entry : fs::directory_iterator(room / "processed", ec)) {
        const auto name = entry.path().filename().string();
        const auto dot  = name.find('.');
        if(dot == std::string::npos) {
            continue;
        }
        if(const auto seq = parse_seq(std::string_view(name).substr(0, dot))) {
            ret.emplace(*seq, name.substr(dot + 1));
        }
    }
    ensure(!ec, "failed to list processed marks: {}", ec.message());
    return ret;
}

auto DirectoryMailbox::create_room(const PeerInfo& creator) -> std::expected<std::string, Error> {
    if(!is_valid_id(creator.id)) {
        return std::unexpected(Error::InvalidId);
    }
    auto ec = std::error_code();
    if(!fs::is_directory(root, ec)) {
        LOG_WARN(logger, "mailbox directory {} is not available", root.string());
        return std::unexpected(Error::StoreUnavailable);
    }

    auto id = std::string();
    for(auto attempt = 0;; attempt += 1) {
        if(attempt == 16) {
            LOG_ERROR(logger, "could not find a free room id");
            return std::unexpected(Error::StoreUnavailable);
        }
        id = generate_id();
        if(fs::create_directory(room_dir(id), ec)) {
            break;
        }
        if(ec) {
            LOG_WARN(logger, "failed to create room directory: {}", ec.message());
            return std::unexpected(Error::StoreUnavailable);
        }
    }

    const auto dir = room_dir(id);
    for(const auto sub : room_subdirs) {
        if(fs::create_directory(dir / sub, ec); ec) {
            LOG_WARN(logger, "failed to create {}: {}", (dir / sub).string(), ec.message());
            return std::unexpected(Error::StoreUnavailable);
        }
    }

    auto info           = Json::Value(Json::objectValue);
    info["id"]          = id;
    info["creatorId"]   = creator.id;
    info["creatorName"] = creator.name;
    info["createdAt"]   = Json::Int64(now_millis());
    const auto staged   = stage(dir, to_json_text(info));
    if(!staged) {
        return std::unexpected(Error::StoreUnavailable);
    }
    // room.json appears last, its presence marks the room complete
    if(fs::rename(*staged, dir / "room.json", ec); ec) {
        LOG_WARN(logger, "failed to publish room info: {}", ec.message());
        return std::unexpected(Error::StoreUnavailable);
    }

    if(const auto r = append_peer(id, creator); !r) {
        return std::unexpected(r.error());
    }
    LOG_DEBUG(logger, "room {} created by {}", id, creator.id);
    return id;
}

auto DirectoryMailbox::read_room(const std::string_view room_id) -> std::expected<Room, Error> {
    if(const auto e = check_room(room_id)) {
        return std::unexpected(*e);
    }
    const auto dir = room_dir(room_id);

    auto room = Room();
    {
        const auto text         = read_text(dir / "room.json");
        const auto info         = text ? parse_json(*text) : std::nullopt;
        const auto creator_id   = info ? string_member(*info, "creatorId") : std::nullopt;
        const auto creator_name = info ? string_member(*info, "creatorName") : std::nullopt;
        if(!creator_id || !creator_name || !(*info)["createdAt"].isInt64()) {
            LOG_WARN(logger, "room record of {} is damaged", room_id);
            return std::unexpected(Error::StoreUnavailable);
        }
        room.info = RoomInfo{
            .id           = std::string(room_id),
            .creator_id   = *creator_id,
            .creator_name = *creator_name,
            .created_at   = (*info)["createdAt"].asInt64(),
        };
    }

    for(auto n = uint64_t(0);; n += 1) {
        const auto path = dir / "peers" / record_name(n);
        if(!exists(path)) {
            break;
        }
        const auto text = read_text(path);
        const auto peer = text ? parse_json(*text) : std::nullopt;
        const auto id   = peer ? string_member(*peer, "id") : std::nullopt;
        const auto name = peer ? string_member(*peer, "name") : std::nullopt;
        if(!id || !name) {
            return std::unexpected(Error::StoreUnavailable);
        }
        room.peers.push_back(PeerInfo{*id, *name});
    }

    auto messages = read_messages(room_id, 0);
    if(!messages) {
        return std::unexpected(messages.error());
    }
    room.messages = std::move(*messages);
    return room;
}

auto DirectoryMailbox::read_messages(const std::string_view room_id, const uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> {
    if(const auto e = check_room(room_id)) {
        return std::unexpected(*e);
    }
    const auto dir       = room_dir(room_id);
    const auto processed = read_processed(dir);
    if(!processed) {
        return std::unexpected(Error::StoreUnavailable);
    }

    auto ret = std::vector<LogEntry>();
    for(auto seq = from_seq;; seq += 1) {
        const auto path = dir / "messages" / record_name(seq);
        if(!exists(path)) {
            break;
        }
        auto body = read_text(path);
        if(!body) {
            return std::unexpected(Error::StoreUnavailable);
        }
        auto entry = LogEntry{.seq = seq, .body = std::move(*body), .processed_by = {}};
        for(auto [i, end] = processed->equal_range(seq); i != end; i = std::next(i)) {
            entry.processed_by.push_back(i->second);
        }
        ret.push_back(std::move(entry));
    }
    return ret;
}

auto DirectoryMailbox::append_peer(const std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> {
    if(const auto e = check_room(room_id)) {
        return std::unexpected(*e);
    }
    if(!is_valid_id(peer.id)) {
        return std::unexpected(Error::InvalidId);
    }
    const auto dir = room_dir(room_id);

    // claim membership first, the roster entry is written only by the claimer
    const auto marker = stage(dir, peer.name);
    if(!marker) {
        return std::unexpected(Error::StoreUnavailable);
    }
    auto ec = std::error_code();
    fs::create_hard_link(*marker, dir / "members" / peer.id, ec);
    {
        auto remove_ec = std::error_code();
        fs::remove(*marker, remove_ec);
    }
    if(ec == std::errc::file_exists) {
        LOG_DEBUG(logger, "{} is already a member of {}", peer.id, room_id);
        return {};
    }
    if(ec) {
        LOG_WARN(logger, "failed to claim membership: {}", ec.message());
        return std::unexpected(Error::StoreUnavailable);
    }

    auto record    = Json::Value(Json::objectValue);
    record["id"]   = peer.id;
    record["name"] = peer.name;
    if(!publish(dir, dir / "peers", to_json_text(record))) {
        // give the claim back so that a retry writes the roster entry
        auto remove_ec = std::error_code();
        fs::remove(dir / "members" / peer.id, remove_ec);
        return std::unexpected(Error::StoreUnavailable);
    }
    return {};
}

auto DirectoryMailbox::append_message(const std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> {
    if(const auto e = check_room(room_id)) {
        return std::unexpected(*e);
    }
    const auto dir = room_dir(room_id);
    const auto seq = publish(dir, dir / "messages", body);
    if(!seq) {
        return std::unexpected(Error::StoreUnavailable);
    }
    LOG_DEBUG(logger, "appended seq={} to {}", *seq, room_id);
    return *seq;
}

auto DirectoryMailbox::mark_processed(const std::string_view room_id, const uint64_t seq, const std::string_view peer_id) -> std::expected<void, Error> {
    if(const auto e = check_room(room_id)) {
        return std::unexpected(*e);
    }
    if(!is_valid_id(peer_id)) {
        return std::unexpected(Error::InvalidId);
    }
    // marks are empty files, concurrent writers of the same mark agree
    const auto path = room_dir(room_id) / "processed" / std::format("{}.{}", seq, peer_id);
    if(!write_text(path, "")) {
        return std::unexpected(Error::StoreUnavailable);
    }
    return {};
}

DirectoryMailbox::DirectoryMailbox(fs::path root)
    : root(std::move(root)) {
}
} // namespace sdrop
