#include <algorithm>
#include <utility>

#include "signaling-relay.hpp"
#include "ids.hpp"
#include "macros/logger.hpp"

namespace {
auto logger = Logger("sdrop_relay");
}

namespace sdrop {
auto select_messages(const std::span<const LogEntry> entries, const uint64_t cursor, const std::string_view local_id) -> Selection {
    auto ret = Selection{.messages = {}, .quarantined = {}, .cursor = cursor};
    for(const auto& entry : entries) {
        if(entry.seq < ret.cursor) {
            continue;
        }
        ret.cursor = entry.seq + 1;

        auto message = decode(entry);
        if(!message) {
            ret.quarantined.push_back(entry.seq);
            continue;
        }
        if(message->from == local_id || !message->is_addressed_to(local_id) || message->was_processed_by(local_id)) {
            continue;
        }
        ret.messages.push_back(std::move(*message));
    }
    return ret;
}

auto SignalingRelay::build(const std::string_view to, SignalPayload payload) -> std::string {
    auto name = std::string();
    {
        auto guard = std::lock_guard(name_lock);
        name       = local_name;
    }
    return encode(SignalMessage{
        .payload      = std::move(payload),
        .from         = local_id,
        .to           = std::string(to),
        .from_name    = name.empty() ? std::nullopt : std::optional(std::move(name)),
        .timestamp    = now_millis(),
        .seq          = 0,
        .processed_by = {},
    });
}

auto SignalingRelay::wake_worker() -> void {
    auto guard = std::lock_guard(worker_lock);
    wake       = true;
    worker_cond.notify_one();
}

auto SignalingRelay::worker_main() -> void {
    while(true) {
        flush_outbox();
        poll_once();

        auto guard = std::unique_lock(worker_lock);
        worker_cond.wait_for(guard, poll_interval, [this] { return wake || !running; });
        if(!running) {
            break;
        }
        wake = false;
    }
    LOG_DEBUG(logger, "relay worker for {} exited", local_id);
}

auto SignalingRelay::poll_once() -> bool {
    auto guard   = std::lock_guard(poll_lock);
    auto entries = store->read_messages(room_id, cursor);
    if(!entries) {
        LOG_WARN(logger, "poll of room {} failed: {}", room_id, to_string(entries.error()));
        return false;
    }

    auto selection = select_messages(*entries, cursor, local_id);
    for(const auto seq : selection.quarantined) {
        LOG_WARN(logger, "quarantined malformed message seq={} in room {}", seq, room_id);
    }
    for(const auto& message : selection.messages) {
        LOG_DEBUG(logger, "dispatch seq={} type={} from={}", message.seq, type_name(message.payload), message.from);
        // advance before dispatch so a message is never handed out twice
        cursor = std::max(cursor, message.seq + 1);
        if(on_message) {
            on_message(message);
        }
        if(const auto r = store->mark_processed(room_id, message.seq, local_id); !r) {
            LOG_WARN(logger, "failed to mark seq={} processed: {}", message.seq, to_string(r.error()));
        }
    }
    cursor = selection.cursor;
    return true;
}

auto SignalingRelay::flush_outbox() -> bool {
    auto guard = std::lock_guard(outbox_lock);
    while(!outbox.empty()) {
        if(const auto r = store->append_message(room_id, outbox.front()); !r) {
            LOG_WARN(logger, "outbox flush failed, {} message(s) pending: {}", outbox.size(), to_string(r.error()));
            return false;
        }
        outbox.pop_front();
    }
    return true;
}

auto SignalingRelay::publish(const std::string_view to, SignalPayload payload) -> std::expected<uint64_t, Error> {
    auto body  = build(to, std::move(payload));
    auto guard = std::lock_guard(outbox_lock);
    return store->append_message(room_id, std::move(body));
}

auto SignalingRelay::send(const std::string_view to, SignalPayload payload) -> bool {
    const auto type = type_name(payload);
    auto       body = build(to, std::move(payload));

    auto sent = false;
    {
        auto guard = std::lock_guard(outbox_lock);
        // queued messages go first to keep the send order
        if(outbox.empty()) {
            if(const auto r = store->append_message(room_id, body); r) {
                LOG_DEBUG(logger, "sent {} to {} seq={}", type, to, *r);
                sent = true;
            } else {
                LOG_WARN(logger, "failed to send {} to {}, queued: {}", type, to, to_string(r.error()));
            }
        }
        if(!sent) {
            outbox.push_back(std::move(body));
        }
    }
    wake_worker();
    return sent;
}

auto SignalingRelay::set_local_name(std::string name) -> void {
    auto guard = std::lock_guard(name_lock);
    local_name = std::move(name);
}

auto SignalingRelay::get_cursor() -> uint64_t {
    auto guard = std::lock_guard(poll_lock);
    return cursor;
}

auto SignalingRelay::start(const uint64_t initial_cursor) -> void {
    {
        auto guard = std::lock_guard(poll_lock);
        cursor     = initial_cursor;
    }
    {
        auto guard = std::lock_guard(worker_lock);
        if(std::exchange(running, true)) {
            LOG_WARN(logger, "relay already running");
            return;
        }
    }
    worker = std::thread(&SignalingRelay::worker_main, this);
}

auto SignalingRelay::stop() -> void {
    {
        auto guard = std::lock_guard(worker_lock);
        running    = false;
        worker_cond.notify_one();
    }
    if(!worker.joinable()) {
        return;
    }
    if(worker.get_id() == std::this_thread::get_id()) {
        LOG_ERROR(logger, "relay stopped from its own worker");
        worker.detach();
        return;
    }
    worker.join();
}

SignalingRelay::SignalingRelay(SignalingRelayParams params)
    : store(params.store),
      room_id(std::move(params.room_id)),
      local_id(std::move(params.local_id)),
      poll_interval(params.poll_interval),
      local_name(std::move(params.local_name)) {
}

SignalingRelay::~SignalingRelay() {
    stop();
}
} // namespace sdrop
