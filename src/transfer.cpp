#include <array>

#include "transfer.hpp"

namespace sdrop {
namespace {
const auto direction_str = std::array{
    "send",
    "receive",
};

const auto status_str = std::array{
    "pending",
    "transferring",
    "completed",
    "failed",
};
} // namespace

auto to_string(const Direction direction) -> std::string_view {
    return direction_str[size_t(direction)];
}

auto to_string(const TransferStatus status) -> std::string_view {
    return status_str[size_t(status)];
}
} // namespace sdrop
