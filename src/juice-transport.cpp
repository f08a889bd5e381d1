#include <array>
#include <bit>

#include "juice-transport.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_juice");
}

namespace sdrop {
namespace {
auto on_state_changed(juice_agent_t* const /*agent*/, const juice_state_t state, void* const user_ptr) -> void {
    LOG_DEBUG(logger, "state changed to {}", juice_state_to_string(state));
    std::bit_cast<JuiceTransport*>(user_ptr)->on_p2p_state(state);
}

auto on_candidate(juice_agent_t* const /*agent*/, const char* const desc, void* const user_ptr) -> void {
    std::bit_cast<JuiceTransport*>(user_ptr)->on_p2p_new_candidate(std::string_view(desc));
}

auto on_gathering_done(juice_agent_t* const /*agent*/, void* const user_ptr) -> void {
    std::bit_cast<JuiceTransport*>(user_ptr)->on_p2p_gathering_done();
}

auto on_recv(juice_agent_t* const /*agent*/, const char* const data, const size_t size, void* const user_ptr) -> void {
    std::bit_cast<JuiceTransport*>(user_ptr)->on_p2p_packet_received({(const std::byte*)data, size});
}
} // namespace

auto JuiceTransport::create_agent() -> bool {
    ensure(!agent, "agent already created");

    auto config = juice_config_t{
        .stun_server_host  = params.stun_server.address.data(),
        .stun_server_port  = params.stun_server.port,
        .bind_address      = params.bind_address.empty() ? nullptr : params.bind_address.data(),
        .cb_state_changed  = on_state_changed,
        .cb_candidate      = on_candidate,
        .cb_gathering_done = on_gathering_done,
        .cb_recv           = on_recv,
        .user_ptr          = this,
    };
    if(!turn_servers.empty()) {
        config.turn_servers       = turn_servers.data();
        config.turn_servers_count = int(turn_servers.size());
    }
    if(params.local_port_range_begin != 0) {
        config.local_port_range_begin = params.local_port_range_begin;
        config.local_port_range_end   = params.local_port_range_end;
    }
    agent.reset(juice_create(&config));
    ensure(agent, "failed to create ice agent");
    return true;
}

auto JuiceTransport::get_local_description() -> std::optional<std::string> {
    auto desc = std::array<char, JUICE_MAX_SDP_STRING_LEN>();
    ensure(juice_get_local_description(agent.get(), desc.data(), desc.size()) == JUICE_ERR_SUCCESS);
    LOG_DEBUG(logger, "local session description: {}", desc.data());
    return std::string(desc.data());
}

auto JuiceTransport::on_p2p_state(const juice_state_t state) -> void {
    if(closed) {
        return;
    }
    switch(state) {
    case JUICE_STATE_GATHERING:
    case JUICE_STATE_CONNECTING:
    case JUICE_STATE_CONNECTED:
        if(on_state) {
            on_state(TransportState::Connecting);
        }
        break;
    case JUICE_STATE_COMPLETED:
        link.start();
        if(on_state) {
            on_state(TransportState::Connected);
        }
        break;
    case JUICE_STATE_FAILED:
        if(on_state) {
            on_state(TransportState::Failed);
        }
        break;
    default:
        break;
    }
}

auto JuiceTransport::on_p2p_new_candidate(const std::string_view desc) -> void {
    LOG_DEBUG(logger, "new candidate: {}", desc);
    if(on_candidate) {
        on_candidate(desc);
    }
}

auto JuiceTransport::on_p2p_gathering_done() -> void {
    LOG_DEBUG(logger, "gathering done");
    if(on_candidate) {
        on_candidate({});
    }
}

auto JuiceTransport::on_p2p_packet_received(const std::span<const std::byte> payload) -> void {
    link.on_datagram(payload);
}

auto JuiceTransport::create_offer() -> std::optional<std::string> {
    ensure(create_agent());
    return get_local_description();
}

auto JuiceTransport::create_answer(const std::string_view remote_desc) -> std::optional<std::string> {
    ensure(create_agent());
    ensure(juice_set_remote_description(agent.get(), std::string(remote_desc).data()) == JUICE_ERR_SUCCESS, "malformed remote description");
    return get_local_description();
}

auto JuiceTransport::set_remote_answer(const std::string_view remote_desc) -> bool {
    ensure(agent, "no local description yet");
    ensure(juice_set_remote_description(agent.get(), std::string(remote_desc).data()) == JUICE_ERR_SUCCESS, "malformed remote description");
    return true;
}

auto JuiceTransport::add_remote_candidate(const std::string_view candidate) -> bool {
    ensure(agent, "no agent yet");
    if(candidate.empty()) {
        LOG_DEBUG(logger, "remote gathering done");
        ensure(juice_set_remote_gathering_done(agent.get()) == JUICE_ERR_SUCCESS);
        return true;
    }
    LOG_DEBUG(logger, "received candidate: {}", candidate);
    ensure(juice_add_remote_candidate(agent.get(), std::string(candidate).data()) == JUICE_ERR_SUCCESS, "rejected candidate {}", candidate);
    return true;
}

auto JuiceTransport::gather_candidates() -> bool {
    ensure(agent, "no agent yet");
    ensure(juice_gather_candidates(agent.get()) == JUICE_ERR_SUCCESS);
    return true;
}

auto JuiceTransport::close() -> void {
    closed = true;
    link.close();
}

auto JuiceTransport::send(const std::span<const std::byte> payload) -> SendResult {
    if(closed || !link.is_open()) {
        return SendResult::Closed;
    }
    return link.send(payload);
}

auto JuiceTransport::is_open() const -> bool {
    return !closed && link.is_open();
}

JuiceTransport::JuiceTransport(TransportParams params_, const ReliableLinkParams link_params)
    : params(std::move(params_)),
      link(link_params) {
    for(const auto& turn : params.turn_servers) {
        turn_servers.push_back(juice_turn_server_t{
            .host     = turn.host.data(),
            .username = turn.username.data(),
            .password = turn.password.data(),
            .port     = turn.port,
        });
    }

    link.send_datagram = [this](const std::span<const std::byte> datagram) -> bool {
        if(!agent) {
            return false;
        }
        switch(juice_send(agent.get(), (const char*)datagram.data(), datagram.size())) {
        case JUICE_ERR_SUCCESS:
            return true;
        case JUICE_ERR_TOO_LARGE:
            LOG_ERROR(logger, "datagram too large size={}", datagram.size());
            return false;
        default:
            return false;
        }
    };
    link.on_message = [this](const std::span<const std::byte> message) {
        if(on_message) {
            on_message(message);
        }
    };
    link.on_closed = [this](const bool failed) {
        if(closed) {
            return;
        }
        if(on_state) {
            on_state(failed ? TransportState::Failed : TransportState::Closed);
        }
    };
}

JuiceTransport::~JuiceTransport() {
    // the link threads call juice_send, stop them before the agent goes away
    link.stop();
    agent.reset();
}

auto JuiceTransportFactory::create(const TransportParams& params) -> std::unique_ptr<Transport> {
    if(!params.ordered || !params.reliable) {
        LOG_WARN(logger, "channel {} is always ordered and reliable", params.channel_label);
    }
    return std::unique_ptr<Transport>(new JuiceTransport(params, link_params));
}

JuiceTransportFactory::JuiceTransportFactory(const ReliableLinkParams link_params)
    : link_params(link_params) {
}
} // namespace sdrop
