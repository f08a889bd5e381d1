#include <array>

#include "transport.hpp"

namespace sdrop {
namespace {
const auto state_str = std::array{
    "new",
    "connecting",
    "connected",
    "disconnected",
    "failed",
    "closed",
};
} // namespace

auto to_string(const TransportState state) -> std::string_view {
    const auto index = size_t(state);
    return index < state_str.size() ? state_str[index] : "unknown";
}
} // namespace sdrop
