#include "drop-client.hpp"
#include "ids.hpp"
#include "macros/logger.hpp"

namespace {
auto logger = Logger("sdrop_client");
}

namespace sdrop {
auto DropClient::enter(std::string room, const uint64_t initial_cursor) -> void {
    relay->on_message = [this](const SignalMessage& message) { negotiator.handle_signal(message); };
    relay->start(initial_cursor);
    room_id = std::move(room);
    entered = true;
    LOG_INFO(logger, "{} entered room {}", id, room_id);
}

auto DropClient::local_id() const -> std::string_view {
    return id;
}

auto DropClient::local_name() const -> std::string {
    auto guard = std::lock_guard(name_lock);
    return name;
}

auto DropClient::set_local_name(std::string new_name) -> void {
    {
        auto guard = std::lock_guard(name_lock);
        name       = new_name;
    }
    auto guard = std::lock_guard(room_lock);
    if(relay) {
        relay->set_local_name(std::move(new_name));
    }
}

auto DropClient::current_room() -> std::string {
    auto guard = std::lock_guard(room_lock);
    return room_id;
}

auto DropClient::create_room() -> std::expected<std::string, Error> {
    auto guard = std::lock_guard(room_lock);
    if(entered || disconnected) {
        return std::unexpected(Error::AlreadyInRoom);
    }

    const auto room = store->create_room(PeerInfo{id, local_name()});
    if(!room) {
        LOG_ERROR(logger, "failed to create room: {}", to_string(room.error()));
        return std::unexpected(room.error());
    }
    relay = std::make_unique<SignalingRelay>(SignalingRelayParams{
        .store         = store,
        .room_id       = *room,
        .local_id      = id,
        .local_name    = local_name(),
        .poll_interval = poll_interval,
    });
    // the creator answers every join in the log
    enter(*room, 0);
    return *room;
}

auto DropClient::join_room(const std::string_view room) -> std::expected<void, Error> {
    auto guard = std::lock_guard(room_lock);
    if(entered || disconnected) {
        return std::unexpected(Error::AlreadyInRoom);
    }
    if(!is_valid_id(room)) {
        return std::unexpected(Error::InvalidId);
    }

    if(const auto r = store->read_room(room); !r) {
        LOG_ERROR(logger, "cannot join room {}: {}", room, to_string(r.error()));
        return std::unexpected(r.error());
    }
    if(const auto r = store->append_peer(room, PeerInfo{id, local_name()}); !r) {
        LOG_ERROR(logger, "failed to register in room {}: {}", room, to_string(r.error()));
        return std::unexpected(r.error());
    }

    relay = std::make_unique<SignalingRelay>(SignalingRelayParams{
        .store         = store,
        .room_id       = std::string(room),
        .local_id      = id,
        .local_name    = local_name(),
        .poll_interval = poll_interval,
    });
    const auto seq = relay->publish(broadcast_id, signal::Join{});
    if(!seq) {
        LOG_ERROR(logger, "failed to announce in room {}: {}", room, to_string(seq.error()));
        relay.reset();
        return std::unexpected(seq.error());
    }
    // members that were here before our join become the offerers
    enter(std::string(room), *seq + 1);
    return {};
}

auto DropClient::send_file(std::shared_ptr<FileSource> source, const std::string_view peer_id) -> std::expected<std::string, Error> {
    return engine.send_file(std::move(source), peer_id);
}

auto DropClient::cancel_transfer(const std::string_view transfer_id) -> bool {
    return engine.cancel(transfer_id);
}

auto DropClient::disconnect() -> void {
    {
        auto guard = std::lock_guard(room_lock);
        if(std::exchange(disconnected, true)) {
            return;
        }
        if(entered) {
            if(!relay->send(broadcast_id, signal::Leave{})) {
                LOG_WARN(logger, "leave notice for room {} not delivered", room_id);
            }
            relay->stop();
        }
    }
    negotiator.close_all();
    engine.shutdown();
    negotiator.shutdown();
    LOG_INFO(logger, "{} disconnected", id);
}

auto DropClient::peers() const -> std::vector<PeerSummary> {
    auto ret = negotiator.peers();
    std::erase_if(ret, [](const PeerSummary& peer) { return peer.state != NegotiationState::Connected; });
    return ret;
}

auto DropClient::transfers() -> std::vector<FileTransfer> {
    return engine.transfers();
}

auto DropClient::add_peer_observer(PeerObserver* const observer) -> void {
    negotiator.observers.add(observer);
}

auto DropClient::remove_peer_observer(PeerObserver* const observer) -> void {
    negotiator.observers.remove(observer);
}

auto DropClient::add_transfer_observer(TransferObserver* const observer) -> void {
    engine.observers.add(observer);
}

auto DropClient::remove_transfer_observer(TransferObserver* const observer) -> void {
    engine.observers.remove(observer);
}

DropClient::DropClient(DropClientParams params)
    : store(params.store),
      id(params.local_id.empty() ? generate_id() : std::move(params.local_id)),
      poll_interval(params.poll_interval),
      name(std::move(params.local_name)),
      negotiator(SessionNegotiatorParams{.factory = params.transport_factory, .transport = std::move(params.transport)}),
      engine([this](const std::string_view peer_id) { return negotiator.find_channel(peer_id); }, params.transfer) {
    negotiator.send_signal = [this](const std::string_view to, SignalPayload payload) {
        relay->send(to, std::move(payload));
    };
    negotiator.on_channel_message = [this](const std::string_view peer_id, const std::span<const std::byte> payload) {
        engine.handle_message(peer_id, payload);
    };
    negotiator.on_session_closed = [this](const std::string_view peer_id) {
        engine.abort_peer(peer_id);
    };
    negotiator.start();
}

DropClient::~DropClient() {
    disconnect();
}
} // namespace sdrop
