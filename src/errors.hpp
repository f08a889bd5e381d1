#pragma once
#include <cstdint>
#include <string_view>

namespace sdrop {
enum class Error : uint8_t {
    StoreUnavailable = 0,
    RoomNotFound,
    InvalidId,
    AlreadyInRoom,
    NegotiationFailed,
    ChannelNotReady,
    FileTooLarge,
    FileUnreadable,
    TransferFailed,
    TransferCancelled,

    Limit,
};

auto to_string(Error error) -> std::string_view;
} // namespace sdrop
