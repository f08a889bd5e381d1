#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace sdrop {
// lowercase base36, used for peer, room and transfer ids
auto generate_id(size_t length = 9) -> std::string;

// ids double as file names in the directory mailbox
auto is_valid_id(std::string_view id) -> bool;

// unix time in milliseconds
auto now_millis() -> int64_t;
} // namespace sdrop
