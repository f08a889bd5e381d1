#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "room.hpp"

namespace sdrop {
constexpr auto broadcast_id = std::string_view("broadcast");

namespace signal {
struct Join {};

struct Leave {};

struct Offer {
    std::string sdp;
};

struct Answer {
    std::string sdp;
};

// empty candidate marks the end of the sender's candidates
struct IceCandidate {
    std::string candidate;
};
} // namespace signal

using SignalPayload = std::variant<signal::Join, signal::Leave, signal::Offer, signal::Answer, signal::IceCandidate>;

struct SignalMessage {
    SignalPayload            payload;
    std::string              from;
    std::string              to;
    std::optional<std::string> from_name;
    int64_t                  timestamp = 0;

    // filled from the log entry on receive
    uint64_t                 seq = 0;
    std::vector<std::string> processed_by;

    auto is_addressed_to(std::string_view peer_id) const -> bool;
    auto was_processed_by(std::string_view peer_id) const -> bool;
};

auto type_name(const SignalPayload& payload) -> std::string_view;

auto encode(const SignalMessage& message) -> std::string;

// nullopt if the body is not a well formed message of its declared type
auto decode(const LogEntry& entry) -> std::optional<SignalMessage>;
} // namespace sdrop
