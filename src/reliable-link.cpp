#include <algorithm>
#include <utility>

#include "macros/logger.hpp"
#include "reliable-link.hpp"

namespace {
auto logger = Logger("sdrop_link");
}

namespace sdrop {
namespace {
// u8 kind, u8 flags, u64 seq, u64 ack(next expected seq), little endian
constexpr auto header_size = size_t(18);

struct Kind {
    enum : uint8_t {
        Data  = 1,
        Ack   = 2,
        Close = 3,
        Ping  = 4,
    };
};

struct Flags {
    enum : uint8_t {
        Last = 1 << 0,
    };
};

auto put_u64(std::byte* const ptr, const uint64_t value) -> void {
    for(auto i = 0; i < 8; i += 1) {
        ptr[i] = std::byte(value >> (i * 8));
    }
}

auto get_u64(const std::byte* const ptr) -> uint64_t {
    auto value = uint64_t(0);
    for(auto i = 0; i < 8; i += 1) {
        value |= uint64_t(ptr[i]) << (i * 8);
    }
    return value;
}

auto build_packet(const uint8_t kind, const uint8_t flags, const uint64_t seq, const uint64_t ack, const std::span<const std::byte> payload = {}) -> std::vector<std::byte> {
    auto packet = std::vector<std::byte>(header_size + payload.size());
    packet[0]   = std::byte(kind);
    packet[1]   = std::byte(flags);
    put_u64(packet.data() + 2, seq);
    put_u64(packet.data() + 10, ack);
    std::ranges::copy(payload, packet.begin() + header_size);
    return packet;
}
} // namespace

auto ReliableLink::transmit(std::vector<std::byte> packet) -> void {
    last_sent = Clock::now();
    outbox.push_back(std::move(packet));
}

auto ReliableLink::flush() -> void {
    auto packets = std::vector<std::vector<std::byte>>();
    {
        auto guard = std::lock_guard(lock);
        packets.swap(outbox);
    }
    for(const auto& packet : packets) {
        if(!send_datagram || !send_datagram(packet)) {
            // treated as lost, retransmission covers it
            LOG_DEBUG(logger, "datagram send failed size={}", packet.size());
        }
    }
}

auto ReliableLink::handle_ack(const uint64_t ack) -> void {
    if(ack <= send_base || ack > next_seq) {
        return;
    }
    unacked.erase(unacked.begin(), unacked.lower_bound(ack));
    send_base = ack;
    window_cond.notify_all();
}

auto ReliableLink::receive_data(const uint64_t seq, const bool last, const std::span<const std::byte> payload) -> void {
    if(seq < recv_next) {
        return; // duplicate
    }
    if(seq >= recv_next + params.window * 2) {
        LOG_DEBUG(logger, "segment seq={} beyond receive window", seq);
        return;
    }
    out_of_order.try_emplace(seq, Fragment{last, std::vector<std::byte>(payload.begin(), payload.end())});

    for(auto i = out_of_order.find(recv_next); i != out_of_order.end(); i = out_of_order.find(recv_next)) {
        auto& fragment = i->second;
        assembling.insert(assembling.end(), fragment.payload.begin(), fragment.payload.end());
        const auto done = fragment.last;
        out_of_order.erase(i);
        recv_next += 1;
        if(assembling.size() > params.max_message_size) {
            fail("incoming message exceeds size limit");
            return;
        }
        if(done) {
            push_delivery({.message = std::exchange(assembling, {}), .end = false, .failed = false});
        }
    }
    finish_if_closed();
}

auto ReliableLink::fail(const std::string_view reason) -> void {
    if(state == LinkState::Closed || state == LinkState::Failed) {
        return;
    }
    LOG_WARN(logger, "link failed: {}", reason);
    state = LinkState::Failed;
    window_cond.notify_all();
    push_delivery({.message = {}, .end = true, .failed = true});
}

auto ReliableLink::finish_if_closed() -> void {
    if(!close_at || recv_next < *close_at || state == LinkState::Closed || state == LinkState::Failed) {
        return;
    }
    LOG_DEBUG(logger, "peer closed the link");
    state = LinkState::Closed;
    window_cond.notify_all();
    push_delivery({.message = {}, .end = true, .failed = false});
}

auto ReliableLink::push_delivery(Delivery delivery) -> void {
    auto guard = std::lock_guard(delivery_lock);
    deliveries.push_back(std::move(delivery));
    delivery_cond.notify_one();
}

auto ReliableLink::timer_main() -> void {
    auto guard = std::unique_lock(lock);
    while(!stopping) {
        timer_cond.wait_for(guard, params.tick, [this] { return stopping.load(); });
        if(stopping) {
            break;
        }
        if(state != LinkState::Open && state != LinkState::Closing) {
            continue;
        }

        const auto now = Clock::now();
        for(auto& [seq, segment] : unacked) {
            if(now - segment.sent_at < params.retransmit_timeout) {
                continue;
            }
            if(segment.retries >= params.max_retries) {
                fail("retransmission limit reached");
                break;
            }
            segment.retries += 1;
            segment.sent_at = now;
            transmit(segment.packet);
        }
        if(state == LinkState::Open || state == LinkState::Closing) {
            if(now - last_received >= params.peer_timeout) {
                fail("peer timed out");
            } else if(now - last_sent >= params.keepalive) {
                transmit(build_packet(Kind::Ping, 0, 0, recv_next));
            }
        }
        if(!outbox.empty()) {
            guard.unlock();
            flush();
            guard.lock();
        }
    }
}

auto ReliableLink::deliverer_main() -> void {
    while(true) {
        auto delivery = Delivery();
        {
            auto guard = std::unique_lock(delivery_lock);
            delivery_cond.wait(guard, [this] { return stopping || !deliveries.empty(); });
            if(stopping) {
                return;
            }
            delivery = std::move(deliveries.front());
            deliveries.pop_front();
        }
        if(delivery.end) {
            if(on_closed) {
                on_closed(delivery.failed);
            }
            return;
        }
        if(on_message) {
            on_message(delivery.message);
        }
    }
}

auto ReliableLink::start() -> void {
    auto guard = std::lock_guard(lock);
    if(state != LinkState::Idle) {
        return;
    }
    state         = LinkState::Open;
    last_received = Clock::now();
    last_sent     = last_received;
    timer         = std::thread(&ReliableLink::timer_main, this);
    deliverer     = std::thread(&ReliableLink::deliverer_main, this);
}

auto ReliableLink::stop() -> void {
    {
        auto guard = std::lock_guard(lock);
        stopping   = true;
        timer_cond.notify_all();
        window_cond.notify_all();
    }
    {
        auto guard = std::lock_guard(delivery_lock);
        delivery_cond.notify_all();
    }
    for(auto thread : {&timer, &deliverer}) {
        if(!thread->joinable()) {
            continue;
        }
        if(thread->get_id() == std::this_thread::get_id()) {
            LOG_ERROR(logger, "link stopped from its own thread");
            thread->detach();
            continue;
        }
        thread->join();
    }
}

auto ReliableLink::send(const std::span<const std::byte> message) -> SendResult {
    if(message.size() > params.max_message_size) {
        return SendResult::MessageTooLarge;
    }

    auto send_guard = std::lock_guard(send_lock);
    auto guard      = std::unique_lock(lock);
    auto offset     = size_t(0);
    do {
        window_cond.wait(guard, [this] {
            return stopping || state != LinkState::Open || next_seq - send_base < params.window;
        });
        if(stopping || state != LinkState::Open) {
            return SendResult::Closed;
        }
        const auto len  = std::min(params.segment_size, message.size() - offset);
        const auto last = offset + len == message.size();
        const auto seq  = next_seq;
        next_seq += 1;

        auto packet = build_packet(Kind::Data, last ? Flags::Last : 0, seq, recv_next, message.subspan(offset, len));
        transmit(packet);
        unacked.emplace(seq, Segment{std::move(packet), last_sent, 0});
        offset += len;

        guard.unlock();
        flush();
        guard.lock();
    } while(offset < message.size());
    return SendResult::Success;
}

auto ReliableLink::on_datagram(const std::span<const std::byte> datagram) -> void {
    if(datagram.size() < header_size) {
        LOG_DEBUG(logger, "runt datagram size={}", datagram.size());
        return;
    }
    const auto kind  = uint8_t(datagram[0]);
    const auto flags = uint8_t(datagram[1]);
    const auto seq   = get_u64(datagram.data() + 2);
    const auto ack   = get_u64(datagram.data() + 10);

    {
        auto guard = std::lock_guard(lock);
        if(state == LinkState::Closed || state == LinkState::Failed) {
            return;
        }
        last_received = Clock::now();
        handle_ack(ack);

        switch(kind) {
        case Kind::Data:
            receive_data(seq, flags & Flags::Last, datagram.subspan(header_size));
            if(state != LinkState::Failed) {
                transmit(build_packet(Kind::Ack, 0, 0, recv_next));
            }
            break;
        case Kind::Ack:
        case Kind::Ping:
            break;
        case Kind::Close:
            // seq is the sender's next sequence number, everything before it must arrive first
            if(!close_at || seq < *close_at) {
                close_at = seq;
            }
            finish_if_closed();
            break;
        default:
            LOG_DEBUG(logger, "unknown datagram kind {}", kind);
            break;
        }
    }
    flush();
}

auto ReliableLink::close() -> void {
    {
        auto guard = std::unique_lock(lock);
        if(state != LinkState::Open && state != LinkState::Idle) {
            return;
        }
        if(state == LinkState::Open) {
            state = LinkState::Closing;
            window_cond.notify_all();
            // the timer keeps retransmitting meanwhile
            const auto drained = window_cond.wait_for(guard, params.linger, [this] {
                return stopping || state != LinkState::Closing || unacked.empty();
            });
            if(state != LinkState::Closing) {
                return;
            }
            if(!drained) {
                LOG_WARN(logger, "closing with {} unacknowledged segments", unacked.size());
            }
        }
        state = LinkState::Closed;
        window_cond.notify_all();
        // no retransmission for the notice, repeat it instead
        const auto packet = build_packet(Kind::Close, 0, next_seq, recv_next);
        for(auto i = 0; i < 3; i += 1) {
            transmit(packet);
        }
    }
    flush();
}

auto ReliableLink::get_state() const -> LinkState {
    auto guard = std::lock_guard(lock);
    return state;
}

auto ReliableLink::is_open() const -> bool {
    return get_state() == LinkState::Open;
}

ReliableLink::ReliableLink(ReliableLinkParams params)
    : params(params) {
}

ReliableLink::~ReliableLink() {
    stop();
}
} // namespace sdrop
