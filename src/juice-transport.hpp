#pragma once
#include <atomic>

#include <juice/juice.h>

#include "reliable-link.hpp"
#include "transport.hpp"
#include "util/autoptr.hpp"

namespace sdrop {
declare_autoptr(JuiceAgent, juice_agent_t, juice_destroy);

// transport on a libjuice ice agent
// the agent carries bare datagrams, a ReliableLink on top makes the channel ordered and reliable
class JuiceTransport : public Transport {
  private:
    TransportParams                  params;
    std::vector<juice_turn_server_t> turn_servers;
    ReliableLink                     link;
    AutoJuiceAgent                   agent;
    std::atomic_bool                 closed = false;

    auto create_agent() -> bool;
    auto get_local_description() -> std::optional<std::string>;

  public:
    // internal use
    auto on_p2p_state(juice_state_t state) -> void;
    auto on_p2p_new_candidate(std::string_view desc) -> void;
    auto on_p2p_gathering_done() -> void;
    auto on_p2p_packet_received(std::span<const std::byte> payload) -> void;

    // api
    auto create_offer() -> std::optional<std::string> override;
    auto create_answer(std::string_view remote_desc) -> std::optional<std::string> override;
    auto set_remote_answer(std::string_view remote_desc) -> bool override;
    auto add_remote_candidate(std::string_view candidate) -> bool override;
    auto gather_candidates() -> bool override;
    auto close() -> void override;
    auto send(std::span<const std::byte> payload) -> SendResult override;
    auto is_open() const -> bool override;

    JuiceTransport(TransportParams params, ReliableLinkParams link_params = {});
    ~JuiceTransport();
};

class JuiceTransportFactory : public TransportFactory {
  private:
    ReliableLinkParams link_params;

  public:
    auto create(const TransportParams& params) -> std::unique_ptr<Transport> override;

    JuiceTransportFactory(ReliableLinkParams link_params = {});
};
} // namespace sdrop
