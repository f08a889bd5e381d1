#pragma once
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

#include "errors.hpp"
#include "file-source.hpp"
#include "mailbox-store.hpp"
#include "observer.hpp"
#include "session-negotiator.hpp"
#include "signaling-relay.hpp"
#include "transfer-engine.hpp"
#include "transport.hpp"

namespace sdrop {
struct DropClientParams {
    MailboxStore*             store;
    TransportFactory*         transport_factory;
    std::string               local_name;
    std::string               local_id      = {}; // empty: generated
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2000);
    TransportParams           transport     = {};
    TransferEngineParams      transfer      = {};
};

// one peer in one room.
// a client enters at most one room during its lifetime.
class DropClient {
  private:
    MailboxStore*             store;
    std::string               id;
    std::chrono::milliseconds poll_interval;

    mutable std::mutex name_lock;
    std::string        name;

    SessionNegotiator               negotiator;
    TransferEngine                  engine;
    std::unique_ptr<SignalingRelay> relay;

    std::mutex  room_lock;
    std::string room_id;
    bool        entered      = false;
    bool        disconnected = false;

    auto enter(std::string room, uint64_t initial_cursor) -> void;

  public:
    auto local_id() const -> std::string_view;
    auto local_name() const -> std::string;
    auto set_local_name(std::string new_name) -> void;
    auto current_room() -> std::string;

    // creates a room with this client as its creator
    auto create_room() -> std::expected<std::string, Error>;
    // returns without waiting for any peer
    auto join_room(std::string_view room) -> std::expected<void, Error>;
    // returns the transfer id
    auto send_file(std::shared_ptr<FileSource> source, std::string_view peer_id) -> std::expected<std::string, Error>;
    auto cancel_transfer(std::string_view transfer_id) -> bool;
    auto disconnect() -> void;

    // connected peers
    auto peers() const -> std::vector<PeerSummary>;
    auto transfers() -> std::vector<FileTransfer>;

    auto add_peer_observer(PeerObserver* observer) -> void;
    auto remove_peer_observer(PeerObserver* observer) -> void;
    auto add_transfer_observer(TransferObserver* observer) -> void;
    auto remove_transfer_observer(TransferObserver* observer) -> void;

    DropClient(DropClientParams params);
    ~DropClient();
};
} // namespace sdrop
