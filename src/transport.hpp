#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sdrop {
enum class SendResult {
    Success,
    WouldBlock,
    MessageTooLarge,
    Closed,
    UnknownError,
};

enum class TransportState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed,
};

auto to_string(TransportState state) -> std::string_view;

struct ServerLocation {
    std::string address;
    uint16_t    port;
};

struct TurnServer {
    std::string host;
    std::string username;
    std::string password;
    uint16_t    port = 3478;
};

struct TransportParams {
    ServerLocation          stun_server = {"stun.l.google.com", 19302};
    std::vector<TurnServer> turn_servers;
    std::string             bind_address; // empty: any
    uint16_t                local_port_range_begin = 0;
    uint16_t                local_port_range_end   = 0;
    std::string             channel_label          = "fileTransfer";
    bool                    ordered                = true;
    bool                    reliable               = true;
};

// message channel to one peer
class Channel {
  public:
    virtual auto send(std::span<const std::byte> payload) -> SendResult = 0;
    virtual auto is_open() const -> bool                                = 0;

    virtual ~Channel() {}
};

// connection to one peer
// callbacks must be set before the first create_* call.
// they run on transport owned threads, possibly while a call into the transport is in progress,
// and never after its destruction.
class Transport : public Channel {
  public:
    // empty candidate: local gathering finished
    std::function<void(std::string_view candidate)>             on_candidate;
    std::function<void(TransportState state)>                   on_state;
    std::function<void(std::span<const std::byte> payload)>     on_message;

    // returns the local description
    virtual auto create_offer() -> std::optional<std::string>                         = 0;
    virtual auto create_answer(std::string_view remote_desc) -> std::optional<std::string> = 0;
    virtual auto set_remote_answer(std::string_view remote_desc) -> bool              = 0;
    // empty candidate: remote gathering finished
    virtual auto add_remote_candidate(std::string_view candidate) -> bool = 0;
    // call after the local description has been handed to the peer
    virtual auto gather_candidates() -> bool = 0;
    virtual auto close() -> void             = 0;
};

class TransportFactory {
  public:
    virtual auto create(const TransportParams& params) -> std::unique_ptr<Transport> = 0;

    virtual ~TransportFactory() {}
};
} // namespace sdrop
