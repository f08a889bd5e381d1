#include <algorithm>
#include <array>

#include "macros/logger.hpp"
#include "session-negotiator.hpp"

namespace {
auto logger = Logger("sdrop_negotiator");
}

namespace sdrop {
namespace {
const auto state_str = std::array{
    "idle",
    "negotiating(offerer)",
    "negotiating(answerer)",
    "connection pending",
    "connected",
    "closed",
    "failed",
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
} // namespace

auto to_string(const NegotiationState state) -> std::string_view {
    const auto index = size_t(state);
    return index < state_str.size() ? state_str[index] : "unknown";
}

auto SessionNegotiator::find_session(const std::string_view peer_id) -> PeerSession* {
    const auto i = sessions.find(peer_id);
    return i != sessions.end() ? &i->second : nullptr;
}

auto SessionNegotiator::set_state(PeerSession& session, const NegotiationState state) -> void {
    auto guard = std::lock_guard(lock);
    LOG_INFO(logger, "{}: {} -> {}", session.peer_id, to_string(session.state), to_string(state));
    session.state = state;
}

auto SessionNegotiator::create_session(const std::string& peer_id, std::optional<std::string> name, const bool offerer) -> PeerSession* {
    auto transport = std::shared_ptr<Transport>(factory->create(transport_params));
    if(!transport) {
        LOG_ERROR(logger, "failed to create transport for {}", peer_id);
        return nullptr;
    }

    auto guard      = std::lock_guard(lock);
    const auto gen  = next_generation += 1;
    transport->on_candidate = [this, peer_id, gen](const std::string_view candidate) {
        queue.push([this, peer_id, gen, candidate = std::string(candidate)] { on_local_candidate(peer_id, gen, candidate); });
    };
    transport->on_state = [this, peer_id, gen](const TransportState state) {
        queue.push([this, peer_id, gen, state] { on_transport_state(peer_id, gen, state); });
    };
    transport->on_message = [this, peer_id](const std::span<const std::byte> payload) {
        if(on_channel_message) {
            on_channel_message(peer_id, payload);
        }
    };

    ended.erase(peer_id);
    const auto [i, inserted] = sessions.insert_or_assign(peer_id, PeerSession{
                                                                      .peer_id            = peer_id,
                                                                      .display_name       = std::move(name),
                                                                      .state              = offerer ? NegotiationState::NegotiatingOfferer : NegotiationState::NegotiatingAnswerer,
                                                                      .offerer            = offerer,
                                                                      .generation         = gen,
                                                                      .transport          = std::move(transport),
                                                                      .remote_desc_set    = false,
                                                                      .pending_candidates = {},
                                                                  });
    LOG_INFO(logger, "{}: new session as {}", peer_id, offerer ? "offerer" : "answerer");
    return &i->second;
}

auto SessionNegotiator::flush_candidates(PeerSession& session) -> void {
    for(const auto& candidate : std::exchange(session.pending_candidates, {})) {
        if(!session.transport->add_remote_candidate(candidate)) {
            LOG_WARN(logger, "{}: buffered candidate rejected", session.peer_id);
        }
    }
}

auto SessionNegotiator::end_session(const std::string_view peer_id, const NegotiationState final_state) -> void {
    auto transport = std::shared_ptr<Transport>();
    {
        auto       guard = std::lock_guard(lock);
        const auto i     = sessions.find(peer_id);
        if(i == sessions.end()) {
            return;
        }
        LOG_INFO(logger, "{}: {} -> {}", peer_id, to_string(i->second.state), to_string(final_state));
        transport = std::move(i->second.transport);
        sessions.erase(i);
        ended.insert_or_assign(std::string(peer_id), Ended{final_state, next_ended_serial += 1});
        if(ended.size() > max_ended) {
            ended.erase(std::ranges::min_element(ended, {}, [](const auto& e) { return e.second.serial; }));
        }
    }
    if(transport) {
        transport->close();
        retired.push_back(std::move(transport));
    }

    if(final_state == NegotiationState::Failed) {
        observers.notify([peer_id](PeerObserver& o) { o.on_negotiation_failed(peer_id); });
    }
    if(on_session_closed) {
        on_session_closed(peer_id);
    }
    observers.notify([peer_id](PeerObserver& o) { o.on_peer_disconnected(peer_id); });
}

auto SessionNegotiator::reap() -> void {
    std::erase_if(retired, [](const std::shared_ptr<Transport>& transport) { return transport.use_count() == 1; });
}

auto SessionNegotiator::on_join(const SignalMessage& message) -> void {
    if(const auto session = find_session(message.from); session != nullptr) {
        LOG_DEBUG(logger, "{}: join while {}, ignored", message.from, to_string(session->state));
        return;
    }

    const auto session = create_session(message.from, message.from_name, true);
    if(session == nullptr) {
        observers.notify([&message](PeerObserver& o) { o.on_negotiation_failed(message.from); });
        return;
    }
    const auto desc = session->transport->create_offer();
    if(!desc) {
        LOG_ERROR(logger, "{}: failed to create offer", message.from);
        end_session(message.from, NegotiationState::Failed);
        return;
    }
    send_signal(message.from, signal::Offer{*desc});
    if(!session->transport->gather_candidates()) {
        LOG_ERROR(logger, "{}: failed to start gathering", message.from);
        end_session(message.from, NegotiationState::Failed);
    }
}

auto SessionNegotiator::on_offer(const SignalMessage& message, const signal::Offer& offer) -> void {
    if(const auto session = find_session(message.from); session != nullptr) {
        LOG_ERROR(logger, "{}: unexpected offer while {}", message.from, to_string(session->state));
        end_session(message.from, NegotiationState::Failed);
        return;
    }

    const auto session = create_session(message.from, message.from_name, false);
    if(session == nullptr) {
        observers.notify([&message](PeerObserver& o) { o.on_negotiation_failed(message.from); });
        return;
    }
    const auto desc = session->transport->create_answer(offer.sdp);
    if(!desc) {
        LOG_ERROR(logger, "{}: malformed offer", message.from);
        end_session(message.from, NegotiationState::Failed);
        return;
    }
    session->remote_desc_set = true;
    send_signal(message.from, signal::Answer{*desc});
    set_state(*session, NegotiationState::ConnectionPending);
    flush_candidates(*session);
    if(!session->transport->gather_candidates()) {
        LOG_ERROR(logger, "{}: failed to start gathering", message.from);
        end_session(message.from, NegotiationState::Failed);
    }
}

auto SessionNegotiator::on_answer(const SignalMessage& message, const signal::Answer& answer) -> void {
    const auto session = find_session(message.from);
    if(session == nullptr) {
        LOG_WARN(logger, "{}: answer without session, ignored", message.from);
        return;
    }
    const auto acceptable = session->offerer && !session->remote_desc_set &&
                            (session->state == NegotiationState::NegotiatingOfferer || session->state == NegotiationState::ConnectionPending);
    if(!acceptable) {
        LOG_ERROR(logger, "{}: unexpected answer while {}", message.from, to_string(session->state));
        end_session(message.from, NegotiationState::Failed);
        return;
    }
    if(!session->transport->set_remote_answer(answer.sdp)) {
        LOG_ERROR(logger, "{}: malformed answer", message.from);
        end_session(message.from, NegotiationState::Failed);
        return;
    }
    session->remote_desc_set = true;
    set_state(*session, NegotiationState::ConnectionPending);
    flush_candidates(*session);
}

auto SessionNegotiator::on_candidate(const SignalMessage& message, const signal::IceCandidate& candidate) -> void {
    const auto session = find_session(message.from);
    if(session == nullptr) {
        LOG_DEBUG(logger, "{}: candidate without session, ignored", message.from);
        return;
    }
    if(!session->remote_desc_set) {
        session->pending_candidates.push_back(candidate.candidate);
        return;
    }
    if(!session->transport->add_remote_candidate(candidate.candidate)) {
        LOG_WARN(logger, "{}: candidate rejected", message.from);
    }
}

auto SessionNegotiator::on_local_candidate(const std::string& peer_id, const uint64_t generation, const std::string& candidate) -> void {
    const auto session = find_session(peer_id);
    if(session == nullptr || session->generation != generation) {
        return;
    }
    send_signal(peer_id, signal::IceCandidate{candidate});
}

auto SessionNegotiator::on_transport_state(const std::string& peer_id, const uint64_t generation, const TransportState state) -> void {
    const auto session = find_session(peer_id);
    if(session == nullptr || session->generation != generation) {
        return;
    }
    LOG_DEBUG(logger, "{}: transport {}", peer_id, to_string(state));

    switch(state) {
    case TransportState::New:
    case TransportState::Connecting:
        break;
    case TransportState::Connected: {
        if(session->state == NegotiationState::Connected) {
            break;
        }
        set_state(*session, NegotiationState::Connected);
        const auto name = session->display_name;
        observers.notify([&peer_id, &name](PeerObserver& o) {
            o.on_peer_connected(peer_id, name ? std::optional<std::string_view>(*name) : std::nullopt);
        });
    } break;
    case TransportState::Failed:
        // a link that never came up is a failed negotiation
        end_session(peer_id, session->state == NegotiationState::Connected ? NegotiationState::Closed : NegotiationState::Failed);
        break;
    case TransportState::Disconnected:
    case TransportState::Closed:
        end_session(peer_id, NegotiationState::Closed);
        break;
    }
}

auto SessionNegotiator::process(const SignalMessage& message) -> void {
    std::visit(Overloaded{
                   [this, &message](const signal::Join&) { on_join(message); },
                   [this, &message](const signal::Leave&) { end_session(message.from, NegotiationState::Closed); },
                   [this, &message](const signal::Offer& o) { on_offer(message, o); },
                   [this, &message](const signal::Answer& a) { on_answer(message, a); },
                   [this, &message](const signal::IceCandidate& c) { on_candidate(message, c); },
               },
               message.payload);
}

auto SessionNegotiator::start() -> void {
    queue.start();
}

auto SessionNegotiator::handle_signal(const SignalMessage& message) -> void {
    if(!queue.push([this, message] {
           process(message);
           reap();
       })) {
        LOG_DEBUG(logger, "negotiator stopped, dropped {} from {}", type_name(message.payload), message.from);
    }
}

auto SessionNegotiator::find_channel(const std::string_view peer_id) const -> std::shared_ptr<Channel> {
    auto       guard = std::lock_guard(lock);
    const auto i     = sessions.find(peer_id);
    if(i == sessions.end() || i->second.state != NegotiationState::Connected) {
        return nullptr;
    }
    return i->second.transport;
}

auto SessionNegotiator::get_state(const std::string_view peer_id) const -> NegotiationState {
    auto guard = std::lock_guard(lock);
    if(const auto i = sessions.find(peer_id); i != sessions.end()) {
        return i->second.state;
    }
    if(const auto i = ended.find(peer_id); i != ended.end()) {
        return i->second.state;
    }
    return NegotiationState::Idle;
}

auto SessionNegotiator::peers() const -> std::vector<PeerSummary> {
    auto guard = std::lock_guard(lock);
    auto ret   = std::vector<PeerSummary>();
    for(const auto& [id, session] : sessions) {
        ret.push_back(PeerSummary{id, session.display_name, session.state});
    }
    return ret;
}

auto SessionNegotiator::close_all() -> void {
    queue.run_sync([this] {
        auto ids = std::vector<std::string>();
        {
            auto guard = std::lock_guard(lock);
            for(const auto& [id, session] : sessions) {
                ids.push_back(id);
            }
        }
        for(const auto& id : ids) {
            end_session(id, NegotiationState::Closed);
        }
        reap();
    });
}

auto SessionNegotiator::shutdown() -> void {
    close_all();
    queue.stop();
    // channels handed out by find_channel must be released by now
    for(const auto& transport : retired) {
        if(transport.use_count() > 1) {
            LOG_WARN(logger, "a closed transport is still referenced");
        }
    }
    retired.clear();
}

SessionNegotiator::SessionNegotiator(SessionNegotiatorParams params)
    : factory(params.factory),
      transport_params(std::move(params.transport)),
      max_ended(params.max_ended) {
}

SessionNegotiator::~SessionNegotiator() {
    shutdown();
}
} // namespace sdrop
