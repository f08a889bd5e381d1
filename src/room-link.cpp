#include <format>

#include "ids.hpp"
#include "room-link.hpp"

namespace sdrop {
namespace {
constexpr auto room_key = std::string_view("room=");

auto trim(std::string_view text) -> std::string_view {
    while(!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\n' || text.front() == '\r')) {
        text.remove_prefix(1);
    }
    while(!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}
} // namespace

auto make_room_link(const std::string_view base, const std::string_view room_id) -> std::string {
    const auto separator = base.find('?') == std::string_view::npos ? '?' : '&';
    return std::format("{}{}{}{}", base, separator, room_key, room_id);
}

auto parse_room_link(std::string_view text) -> std::optional<std::string> {
    text = trim(text);
    if(is_valid_id(text)) {
        return std::string(text);
    }

    const auto query = text.find('?');
    if(query == std::string_view::npos) {
        return std::nullopt;
    }
    auto params = text.substr(query + 1);
    if(const auto fragment = params.find('#'); fragment != std::string_view::npos) {
        params = params.substr(0, fragment);
    }
    while(!params.empty()) {
        const auto end   = params.find('&');
        const auto param = params.substr(0, end);
        if(param.starts_with(room_key)) {
            const auto id = param.substr(room_key.size());
            if(!is_valid_id(id)) {
                return std::nullopt;
            }
            return std::string(id);
        }
        if(end == std::string_view::npos) {
            break;
        }
        params = params.substr(end + 1);
    }
    return std::nullopt;
}
} // namespace sdrop
