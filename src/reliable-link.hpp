#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <vector>

#include "transport.hpp"

namespace sdrop {
struct ReliableLinkParams {
    size_t                    segment_size       = 1100;
    size_t                    window             = 128; // segments in flight
    size_t                    max_message_size   = 16 * 1024 * 1024;
    std::chrono::milliseconds retransmit_timeout = std::chrono::milliseconds(250);
    int                       max_retries        = 40;
    std::chrono::milliseconds keepalive          = std::chrono::milliseconds(1000);
    std::chrono::milliseconds peer_timeout       = std::chrono::milliseconds(15000);
    std::chrono::milliseconds tick               = std::chrono::milliseconds(20);
    std::chrono::milliseconds linger             = std::chrono::milliseconds(5000); // close waits this long for unacked data
};

enum class LinkState {
    Idle,
    Open,
    Closing,
    Closed,
    Failed,
};

// ordered, reliable, message preserving stream over a datagram path that may drop, duplicate or reorder.
// received messages and the close notice are delivered from a dedicated thread, in order.
class ReliableLink {
  private:
    using Clock = std::chrono::steady_clock;

    struct Segment {
        std::vector<std::byte> packet;
        Clock::time_point      sent_at;
        int                    retries;
    };

    struct Fragment {
        bool                   last;
        std::vector<std::byte> payload;
    };

    struct Delivery {
        std::vector<std::byte> message;
        bool                   end    = false;
        bool                   failed = false;
    };

    ReliableLinkParams params;

    mutable std::mutex      lock;
    std::condition_variable window_cond;
    std::condition_variable timer_cond;
    LinkState               state = LinkState::Idle;
    Clock::time_point       last_sent;
    Clock::time_point       last_received;
    // send side
    std::mutex                  send_lock;
    uint64_t                    next_seq  = 0;
    uint64_t                    send_base = 0;
    std::map<uint64_t, Segment> unacked;
    // receive side
    uint64_t                     recv_next = 0;
    std::optional<uint64_t>      close_at; // sequence number carried by the peer's close notice
    std::map<uint64_t, Fragment> out_of_order;
    std::vector<std::byte>       assembling;

    std::mutex              delivery_lock;
    std::condition_variable delivery_cond;
    std::deque<Delivery>    deliveries;

    // datagrams queued under lock, sent by flush() without it
    std::vector<std::vector<std::byte>> outbox;

    std::atomic_bool stopping = false;
    std::thread      timer;
    std::thread      deliverer;

    // the following require lock
    auto transmit(std::vector<std::byte> packet) -> void;
    auto handle_ack(uint64_t ack) -> void;
    auto receive_data(uint64_t seq, bool last, std::span<const std::byte> payload) -> void;
    auto fail(std::string_view reason) -> void;
    auto push_delivery(Delivery delivery) -> void;
    auto finish_if_closed() -> void;

    // must be called without lock, send_datagram may block on the path's own lock
    auto flush() -> void;

    auto timer_main() -> void;
    auto deliverer_main() -> void;

  public:
    std::function<bool(std::span<const std::byte> datagram)> send_datagram;
    std::function<void(std::span<const std::byte> message)>  on_message;
    std::function<void(bool failed)>                         on_closed;

    auto start() -> void;
    auto stop() -> void;
    // blocks while the send window is full
    auto send(std::span<const std::byte> message) -> SendResult;
    auto on_datagram(std::span<const std::byte> datagram) -> void;
    // waits until the data already sent is acknowledged or linger expires, then notifies the peer
    auto close() -> void;
    auto get_state() const -> LinkState;
    auto is_open() const -> bool;

    ReliableLink(ReliableLinkParams params = {});
    ~ReliableLink();
};
} // namespace sdrop
