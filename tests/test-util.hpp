#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "mailbox-store.hpp"
#include "observer.hpp"

namespace sdrop::test {
inline auto wait_until(const std::function<bool()>& condition, const std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!condition()) {
        if(std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

inline auto to_bytes(const std::string_view str) -> std::vector<std::byte> {
    auto ret = std::vector<std::byte>(str.size());
    for(auto i = size_t(0); i < str.size(); i += 1) {
        ret[i] = std::byte(str[i]);
    }
    return ret;
}

inline auto pattern_bytes(const size_t size, const uint8_t seed = 0) -> std::vector<std::byte> {
    auto ret = std::vector<std::byte>(size);
    for(auto i = size_t(0); i < size; i += 1) {
        ret[i] = std::byte(uint8_t(i * 31 + seed));
    }
    return ret;
}

class Recorder : public PeerObserver, public TransferObserver {
  private:
    mutable std::mutex lock;

  public:
    struct Failure {
        std::string id;
        Error       error;
    };

    std::vector<std::pair<std::string, std::optional<std::string>>> connected;
    std::vector<std::string>                                         disconnected;
    std::vector<std::string>                                         negotiation_failed;
    std::vector<FileTransfer>                                        incoming;
    std::map<std::string, std::vector<double>>                       progress;
    std::vector<std::string>                                         completed;
    std::vector<Failure>                                             failed;
    std::map<std::string, std::vector<std::byte>>                    received;
    // "received:<id>" and "complete:<id>" in call order
    std::vector<std::string> order;

    auto on_peer_connected(const std::string_view peer_id, const std::optional<std::string_view> name) -> void override {
        auto guard = std::lock_guard(lock);
        connected.emplace_back(std::string(peer_id), name ? std::optional<std::string>(*name) : std::nullopt);
    }

    auto on_peer_disconnected(const std::string_view peer_id) -> void override {
        auto guard = std::lock_guard(lock);
        disconnected.emplace_back(peer_id);
    }

    auto on_negotiation_failed(const std::string_view peer_id) -> void override {
        auto guard = std::lock_guard(lock);
        negotiation_failed.emplace_back(peer_id);
    }

    auto on_incoming_file(const FileTransfer& transfer) -> void override {
        auto guard = std::lock_guard(lock);
        incoming.push_back(transfer);
    }

    auto on_transfer_progress(const FileTransfer& transfer, const double percent) -> void override {
        auto guard = std::lock_guard(lock);
        progress[transfer.id].push_back(percent);
    }

    auto on_transfer_complete(const FileTransfer& transfer) -> void override {
        auto guard = std::lock_guard(lock);
        completed.push_back(transfer.id);
        order.push_back("complete:" + transfer.id);
    }

    auto on_transfer_failed(const FileTransfer& transfer, const Error error) -> void override {
        auto guard = std::lock_guard(lock);
        failed.push_back({transfer.id, error});
    }

    auto on_file_received(const FileTransfer& transfer, const std::span<const std::byte> content) -> void override {
        auto guard = std::lock_guard(lock);
        received[transfer.id] = std::vector<std::byte>(content.begin(), content.end());
        order.push_back("received:" + transfer.id);
    }

    // runs func with the recorded state locked
    auto with(const std::function<bool(const Recorder&)>& func) const -> bool {
        auto guard = std::lock_guard(lock);
        return func(*this);
    }
};

// forwards to another store, failing on request
class FlakyStore : public MailboxStore {
  private:
    MailboxStore* inner;

  public:
    std::atomic_int  failing_appends = 0; // the next n appends fail
    std::atomic_bool failing_reads   = false;

    auto create_room(const PeerInfo& creator) -> std::expected<std::string, Error> override {
        return inner->create_room(creator);
    }

    auto read_room(const std::string_view room_id) -> std::expected<Room, Error> override {
        if(failing_reads) {
            return std::unexpected(Error::StoreUnavailable);
        }
        return inner->read_room(room_id);
    }

    auto read_messages(const std::string_view room_id, const uint64_t from_seq) -> std::expected<std::vector<LogEntry>, Error> override {
        if(failing_reads) {
            return std::unexpected(Error::StoreUnavailable);
        }
        return inner->read_messages(room_id, from_seq);
    }

    auto append_peer(const std::string_view room_id, const PeerInfo& peer) -> std::expected<void, Error> override {
        return inner->append_peer(room_id, peer);
    }

    auto append_message(const std::string_view room_id, std::string body) -> std::expected<uint64_t, Error> override {
        if(failing_appends > 0) {
            failing_appends -= 1;
            return std::unexpected(Error::StoreUnavailable);
        }
        return inner->append_message(room_id, std::move(body));
    }

    auto mark_processed(const std::string_view room_id, const uint64_t seq, const std::string_view peer_id) -> std::expected<void, Error> override {
        return inner->mark_processed(room_id, seq, peer_id);
    }

    FlakyStore(MailboxStore& inner)
        : inner(&inner) {}
};
} // namespace sdrop::test
