#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "observer.hpp"
#include "signal-message.hpp"
#include "task-queue.hpp"
#include "transport.hpp"

namespace sdrop {
enum class NegotiationState {
    Idle,
    NegotiatingOfferer,
    NegotiatingAnswerer,
    ConnectionPending,
    Connected,
    Closed,
    Failed,
};

auto to_string(NegotiationState state) -> std::string_view;

struct PeerSession {
    std::string                peer_id;
    std::optional<std::string> display_name;
    NegotiationState           state;
    bool                       offerer;
    uint64_t                   generation;
    std::shared_ptr<Transport> transport;
    bool                       remote_desc_set = false;
    std::vector<std::string>   pending_candidates; // arrived before the remote description
};

struct PeerSummary {
    std::string                id;
    std::optional<std::string> name;
    NegotiationState           state;
};

struct SessionNegotiatorParams {
    TransportFactory* factory;
    TransportParams   transport = {};
    size_t            max_ended = 256; // final states kept for peers without a session
};

// one session per remote peer, driven by signaling messages and transport events.
// every transition runs on an internal task queue.
class SessionNegotiator {
  private:
    TransportFactory* factory;
    TransportParams   transport_params;
    TaskQueue         queue;

    // sessions is modified only on the queue, under lock
    mutable std::mutex                                   lock;
    std::map<std::string, PeerSession, std::less<>>      sessions;
    struct Ended {
        NegotiationState state;
        uint64_t         serial;
    };

    std::map<std::string, Ended, std::less<>> ended;
    size_t                                    max_ended;
    uint64_t                                  next_ended_serial = 0;
    uint64_t                                  next_generation   = 0;

    // closed transports, destroyed on the queue once nobody else holds them
    std::vector<std::shared_ptr<Transport>> retired;

    // the following run on the queue
    auto process(const SignalMessage& message) -> void;
    auto on_join(const SignalMessage& message) -> void;
    auto on_offer(const SignalMessage& message, const signal::Offer& offer) -> void;
    auto on_answer(const SignalMessage& message, const signal::Answer& answer) -> void;
    auto on_candidate(const SignalMessage& message, const signal::IceCandidate& candidate) -> void;
    auto on_local_candidate(const std::string& peer_id, uint64_t generation, const std::string& candidate) -> void;
    auto on_transport_state(const std::string& peer_id, uint64_t generation, TransportState state) -> void;
    auto create_session(const std::string& peer_id, std::optional<std::string> name, bool offerer) -> PeerSession*;
    auto find_session(std::string_view peer_id) -> PeerSession*;
    auto set_state(PeerSession& session, NegotiationState state) -> void;
    auto flush_candidates(PeerSession& session) -> void;
    auto end_session(std::string_view peer_id, NegotiationState final_state) -> void;
    auto reap() -> void;

  public:
    // outgoing signaling, called from the queue
    std::function<void(std::string_view to, SignalPayload payload)> send_signal;
    // channel data, called from transport threads
    std::function<void(std::string_view peer_id, std::span<const std::byte> payload)> on_channel_message;
    // a session ended, called from the queue before observers are told
    std::function<void(std::string_view peer_id)> on_session_closed;

    ObserverList<PeerObserver> observers;

    auto start() -> void;
    auto handle_signal(const SignalMessage& message) -> void;
    // nullptr unless connected
    auto find_channel(std::string_view peer_id) const -> std::shared_ptr<Channel>;
    auto get_state(std::string_view peer_id) const -> NegotiationState;
    auto peers() const -> std::vector<PeerSummary>;
    // ends every session and waits for it
    auto close_all() -> void;
    auto shutdown() -> void;

    SessionNegotiator(SessionNegotiatorParams params);
    ~SessionNegotiator();
};
} // namespace sdrop
