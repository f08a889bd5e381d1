#include <array>

#include "errors.hpp"

namespace sdrop {
namespace {
constexpr auto error_str = std::array{
    "mailbox store unavailable",        // StoreUnavailable
    "no such room",                     // RoomNotFound
    "invalid id",                       // InvalidId
    "already in a room",                // AlreadyInRoom
    "negotiation failed",               // NegotiationFailed
    "channel not ready",                // ChannelNotReady
    "file exceeds the size limit",      // FileTooLarge
    "file could not be read",           // FileUnreadable
    "transfer failed",                  // TransferFailed
    "transfer cancelled",               // TransferCancelled
};

static_assert(size_t(Error::Limit) == error_str.size());
} // namespace

auto to_string(const Error error) -> std::string_view {
    const auto index = size_t(error);
    return index < error_str.size() ? error_str[index] : "unknown error";
}
} // namespace sdrop
