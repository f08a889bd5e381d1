#pragma once
#include <algorithm>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "transfer.hpp"

namespace sdrop {
class PeerObserver {
  public:
    virtual auto on_peer_connected(std::string_view /*peer_id*/, std::optional<std::string_view> /*name*/) -> void {}
    virtual auto on_peer_disconnected(std::string_view /*peer_id*/) -> void {}
    virtual auto on_negotiation_failed(std::string_view /*peer_id*/) -> void {}

    virtual ~PeerObserver() {}
};

class TransferObserver {
  public:
    // a peer started sending a file to us
    virtual auto on_incoming_file(const FileTransfer& /*transfer*/) -> void {}
    virtual auto on_transfer_progress(const FileTransfer& /*transfer*/, double /*percent*/) -> void {}
    virtual auto on_transfer_complete(const FileTransfer& /*transfer*/) -> void {}
    virtual auto on_transfer_failed(const FileTransfer& /*transfer*/, Error /*error*/) -> void {}
    // whole content of a received file, called just before on_transfer_complete
    virtual auto on_file_received(const FileTransfer& /*transfer*/, std::span<const std::byte> /*content*/) -> void {}

    virtual ~TransferObserver() {}
};

// observers are called from library threads.
// an observer must stay alive until it is removed and the calls in flight have returned.
template <class T>
class ObserverList {
  private:
    std::mutex      lock;
    std::vector<T*> observers;

  public:
    auto add(T* const observer) -> void {
        auto guard = std::lock_guard(lock);
        if(std::ranges::find(observers, observer) == observers.end()) {
            observers.push_back(observer);
        }
    }

    auto remove(T* const observer) -> void {
        auto guard = std::lock_guard(lock);
        std::erase(observers, observer);
    }

    template <class Func>
    auto notify(const Func& func) -> void {
        auto copy = std::vector<T*>();
        {
            auto guard = std::lock_guard(lock);
            copy       = observers;
        }
        for(const auto observer : copy) {
            func(*observer);
        }
    }
};
} // namespace sdrop
