#include <chrono>
#include <random>

#include "ids.hpp"

namespace sdrop {
namespace {
constexpr auto id_alphabet   = std::string_view("0123456789abcdefghijklmnopqrstuvwxyz");
constexpr auto id_max_length = size_t(64);

auto id_engine() -> std::mt19937_64& {
    thread_local auto engine = std::mt19937_64(std::random_device()());
    return engine;
}
} // namespace

auto generate_id(const size_t length) -> std::string {
    auto dist = std::uniform_int_distribution<size_t>(0, id_alphabet.size() - 1);
    auto id   = std::string(length, '0');
    for(auto& c : id) {
        c = id_alphabet[dist(id_engine())];
    }
    return id;
}

auto is_valid_id(const std::string_view id) -> bool {
    if(id.empty() || id.size() > id_max_length) {
        return false;
    }
    for(const auto c : id) {
        const auto ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if(!ok) {
            return false;
        }
    }
    return true;
}

auto now_millis() -> int64_t {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}
} // namespace sdrop
