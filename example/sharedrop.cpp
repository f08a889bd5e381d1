#include <atomic>
#include <filesystem>
#include <fstream>
#include <print>

#include "directory-mailbox.hpp"
#include "drop-client.hpp"
#include "event-manager.hpp"
#include "juice-transport.hpp"
#include "macros/logger.hpp"
#include "room-link.hpp"
#include "util/argument-parser.hpp"
#include "util/cleaner.hpp"

namespace {
auto logger = Logger("sharedrop");
}

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
struct EventKind {
    enum : uint32_t {
        TransferFinished = 0,

        Limit,
    };
};

class Session : public sdrop::PeerObserver, public sdrop::TransferObserver {
  private:
    sdrop::DropClient*                 client;
    std::shared_ptr<sdrop::FileSource> source;
    std::filesystem::path              outdir;
    sdrop::Events*                     events;

  public:
    std::atomic_int failures = 0;

    auto on_peer_connected(const std::string_view peer_id, const std::optional<std::string_view> name) -> void override {
        std::println("peer connected: {} ({})", peer_id, name.value_or("anonymous"));
        if(!source) {
            return;
        }
        if(const auto r = client->send_file(source, peer_id); !r) {
            LOG_ERROR(logger, "cannot send {} to {}: {}", source->get_name(), peer_id, sdrop::to_string(r.error()));
            failures += 1;
            events->invoke(EventKind::TransferFinished, sdrop::no_id, 0);
        }
    }

    auto on_peer_disconnected(const std::string_view peer_id) -> void override {
        std::println("peer disconnected: {}", peer_id);
    }

    auto on_negotiation_failed(const std::string_view peer_id) -> void override {
        std::println("failed to connect to {}", peer_id);
    }

    auto on_incoming_file(const sdrop::FileTransfer& transfer) -> void override {
        std::println("receiving {} ({}) from {}", transfer.name, sdrop::format_size(transfer.size), transfer.peer_id);
    }

    auto on_transfer_progress(const sdrop::FileTransfer& transfer, const double percent) -> void override {
        std::println("{} {}: {:.1f}% of {}", sdrop::to_string(transfer.direction), transfer.name, percent, sdrop::format_size(transfer.size));
    }

    auto on_file_received(const sdrop::FileTransfer& transfer, const std::span<const std::byte> content) -> void override {
        // never trust a path from the peer
        auto name = std::filesystem::path(transfer.name).filename();
        if(name.empty() || name == "." || name == "..") {
            name = transfer.id;
        }
        const auto path = outdir / name;
        auto       file = std::ofstream(path, std::ios::binary | std::ios::trunc);
        if(!file.write((const char*)content.data(), std::streamsize(content.size()))) {
            LOG_ERROR(logger, "failed to write {}", path.string());
            failures += 1;
            return;
        }
        std::println("saved {}", path.string());
    }

    auto on_transfer_complete(const sdrop::FileTransfer& transfer) -> void override {
        std::println("{} {} done", sdrop::to_string(transfer.direction), transfer.name);
        events->invoke(EventKind::TransferFinished, sdrop::no_id, 1);
    }

    auto on_transfer_failed(const sdrop::FileTransfer& transfer, const sdrop::Error error) -> void override {
        std::println("{} {} failed: {}", sdrop::to_string(transfer.direction), transfer.name, sdrop::to_string(error));
        failures += 1;
        events->invoke(EventKind::TransferFinished, sdrop::no_id, 0);
    }

    Session(sdrop::DropClient& client, std::shared_ptr<sdrop::FileSource> source, std::filesystem::path outdir, sdrop::Events& events)
        : client(&client),
          source(std::move(source)),
          outdir(std::move(outdir)),
          events(&events) {}
};

auto run(const int argc, const char* const* const argv) -> bool {
    auto mailbox   = (const char*)(nullptr);
    auto name      = "sharedrop";
    auto room      = (const char*)(nullptr);
    auto file      = (const char*)(nullptr);
    auto outdir    = ".";
    auto count     = 1;
    auto stun_host = "stun.l.google.com";
    auto stun_port = uint16_t(19302);
    auto help      = false;

    auto parser = args::Parser<uint16_t, uint8_t>();
    parser.kwflag(&help, {"-h", "--help"}, "print this help message", {.no_error_check = true});
    parser.kwarg(&mailbox, {"-m"}, "MAILBOX_DIR", "shared directory holding the rooms");
    parser.kwarg(&name, {"-n"}, "NAME", "display name", {.state = args::State::DefaultValue});
    parser.kwarg(&room, {"-j"}, "ROOM|LINK", "join this room instead of creating one", {.state = args::State::Initialized});
    parser.kwarg(&file, {"-f"}, "FILE", "send this file to every peer", {.state = args::State::Initialized});
    parser.kwarg(&outdir, {"-o"}, "OUTDIR", "directory to save received files", {.state = args::State::DefaultValue});
    parser.kwarg(&count, {"-c"}, "COUNT", "exit after this many transfers", {.state = args::State::DefaultValue});
    parser.kwarg(&stun_host, {"-s"}, "STUN_HOST", "stun server", {.state = args::State::DefaultValue});
    parser.kwarg(&stun_port, {"-p"}, "STUN_PORT", "stun server port", {.state = args::State::DefaultValue});
    if(!parser.parse(argc, argv) || help) {
        std::println("usage: sharedrop {}", parser.get_help());
        return true;
    }

    auto source = std::shared_ptr<sdrop::FileSource>();
    if(file != nullptr) {
        source = sdrop::DiskFileSource::open(file);
        ensure(source, "cannot read {}", file);
    }
    auto ec = std::error_code();
    std::filesystem::create_directories(outdir, ec);
    ensure(!ec, "cannot create {}: {}", outdir, ec.message());

    auto store   = sdrop::DirectoryMailbox(mailbox);
    auto factory = sdrop::JuiceTransportFactory();
    auto client  = sdrop::DropClient({
         .store             = &store,
         .transport_factory = &factory,
         .local_name        = name,
         .transport         = {.stun_server = {stun_host, stun_port}},
    });
    auto events  = sdrop::Events();
    auto session = Session(client, source, outdir, events);
    client.add_peer_observer(&session);
    client.add_transfer_observer(&session);
    const auto cleaner = Cleaner{[&client, &session] {
        client.disconnect();
        client.remove_transfer_observer(&session);
        client.remove_peer_observer(&session);
    }};

    if(room != nullptr) {
        unwrap(room_id, sdrop::parse_room_link(room), "malformed room {}", room);
        if(const auto r = client.join_room(room_id); !r) {
            bail("cannot join {}: {}", room_id, sdrop::to_string(r.error()));
        }
        std::println("joined room {} as {}", room_id, client.local_id());
    } else {
        const auto r = client.create_room();
        if(!r) {
            bail("cannot create room: {}", sdrop::to_string(r.error()));
        }
        std::println("created room {} as {}", *r, client.local_id());
        std::println("share: {}", sdrop::make_room_link(mailbox, *r));
    }

    for(auto i = 0; i < count; i += 1) {
        ensure(events.wait_for(EventKind::TransferFinished));
    }

    return session.failures == 0;
}
} // namespace

auto main(const int argc, const char* const* const argv) -> int {
    logger.set_name_and_detect_loglevel("sharedrop");
    return run(argc, argv) ? 0 : 1;
}
