#pragma once
#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "errors.hpp"
#include "file-source.hpp"
#include "observer.hpp"
#include "transfer-protocol.hpp"
#include "transfer.hpp"
#include "transport.hpp"

namespace sdrop {
// open channel to the peer, or nullptr
using ChannelLookup = std::function<std::shared_ptr<Channel>(std::string_view peer_id)>;

struct TransferEngineParams {
    size_t                    chunk_size     = 16384;
    uint64_t                  max_file_size  = uint64_t(1) << 30;
    std::chrono::milliseconds retry_interval = std::chrono::milliseconds(5); // back-off on a full channel
    size_t                    max_history    = 256;                          // finished transfers kept for transfers()
};

class TransferEngine {
  private:
    struct Record {
        FileTransfer transfer;
        uint64_t     serial;
        // receive side
        uint64_t               next_seq = 0;
        std::vector<std::byte> buffer;
    };

    struct Sender {
        std::thread                       thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    using Notices = std::vector<std::function<void(TransferObserver&)>>;

    TransferEngineParams params;
    ChannelLookup        lookup;

    std::mutex                    lock;
    std::map<std::string, Record> records;
    std::vector<Sender>           senders;
    uint64_t                      next_serial = 0;
    bool                          shut        = false;

    // the following require lock
    auto fail_record(Record& record, Error error, Notices& notices) -> void;
    auto find_active(std::string_view id, std::string_view peer_id, Direction direction) -> Record*;
    auto reap_senders() -> void;
    auto prune_history() -> void;

    // notifies observers, then forgets the oldest finished transfers
    auto flush(Notices& notices) -> void;
    auto reply_abort(std::string_view peer_id, std::string_view id, std::string_view reason) -> void;
    auto send_blocking(Channel& channel, std::string_view id, std::span<const std::byte> packet) -> bool;
    auto sender_main(std::string id, std::shared_ptr<Channel> channel, std::shared_ptr<FileSource> source) -> void;

    auto on_file_start(std::string_view peer_id, proto::FileStart& message) -> void;
    auto on_file_chunk(std::string_view peer_id, proto::FileChunk& message) -> void;
    auto on_file_end(std::string_view peer_id, proto::FileEnd& message) -> void;
    auto on_file_abort(std::string_view peer_id, proto::FileAbort& message) -> void;

  public:
    ObserverList<TransferObserver> observers;

    // starts sending on a background thread, returns the transfer id
    auto send_file(std::shared_ptr<FileSource> source, std::string_view peer_id) -> std::expected<std::string, Error>;
    // either direction, tells the peer with a FileAbort
    auto cancel(std::string_view id) -> bool;
    // a packet received from the channel of peer_id
    auto handle_message(std::string_view peer_id, std::span<const std::byte> packet) -> void;
    // fails every running transfer with the peer
    auto abort_peer(std::string_view peer_id) -> void;
    // fails every running transfer and joins the senders
    auto shutdown() -> void;
    auto transfers() -> std::vector<FileTransfer>;
    auto get_transfer(std::string_view id) -> std::optional<FileTransfer>;

    TransferEngine(ChannelLookup lookup, TransferEngineParams params = {});
    ~TransferEngine();
};
} // namespace sdrop
