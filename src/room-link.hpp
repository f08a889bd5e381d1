#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace sdrop {
// <base>?room=<id>
auto make_room_link(std::string_view base, std::string_view room_id) -> std::string;

// accepts a bare room id or a link made by make_room_link
auto parse_room_link(std::string_view text) -> std::optional<std::string>;
} // namespace sdrop
