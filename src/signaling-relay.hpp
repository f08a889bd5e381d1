#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <span>
#include <thread>

#include "mailbox-store.hpp"
#include "signal-message.hpp"

namespace sdrop {
struct Selection {
    std::vector<SignalMessage> messages;    // to be dispatched, log order
    std::vector<uint64_t>      quarantined; // seqs of malformed entries
    uint64_t                   cursor;      // next seq to read
};

// picks the entries at or after cursor that are addressed to local_id and not yet handled by it
auto select_messages(std::span<const LogEntry> entries, uint64_t cursor, std::string_view local_id) -> Selection;

struct SignalingRelayParams {
    MailboxStore*             store;
    std::string               room_id;
    std::string               local_id;
    std::string               local_name;
    std::chrono::milliseconds poll_interval = std::chrono::milliseconds(2000);
};

class SignalingRelay {
  private:
    MailboxStore*             store;
    std::string               room_id;
    std::string               local_id;
    std::chrono::milliseconds poll_interval;

    std::mutex  name_lock;
    std::string local_name;

    std::mutex poll_lock;
    uint64_t   cursor = 0;

    // encoded messages whose append failed, in send order
    std::mutex              outbox_lock;
    std::deque<std::string> outbox;

    std::mutex              worker_lock;
    std::condition_variable worker_cond;
    bool                    running = false;
    bool                    wake    = false;
    std::thread             worker;

    auto build(std::string_view to, SignalPayload payload) -> std::string;
    auto wake_worker() -> void;
    auto worker_main() -> void;

  public:
    std::function<void(const SignalMessage&)> on_message;

    // reads the log once and dispatches new messages to on_message
    // returns false if the store could not be read
    auto poll_once() -> bool;
    // appends pending outgoing messages, false if some remain
    auto flush_outbox() -> bool;
    // appends synchronously, nothing is queued on failure
    auto publish(std::string_view to, SignalPayload payload) -> std::expected<uint64_t, Error>;
    // appends or queues for the next poll round
    // returns false if the message was queued
    auto send(std::string_view to, SignalPayload payload) -> bool;
    auto set_local_name(std::string name) -> void;
    auto get_cursor() -> uint64_t;
    auto start(uint64_t initial_cursor) -> void;
    auto stop() -> void;

    SignalingRelay(SignalingRelayParams params);
    ~SignalingRelay();
};
} // namespace sdrop
