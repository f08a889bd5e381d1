#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace sdrop {
using EventCallback = std::function<void(uint32_t value)>;

constexpr auto no_id         = uint32_t(-1);
constexpr auto no_value      = uint32_t(-1);
constexpr auto drained_value = uint32_t(-2);

class Events {
  private:
    struct Handler {
        uint32_t      kind;
        uint32_t      id;
        uint32_t      value;
        uint64_t      serial;
        EventCallback callback;
    };

    mutable std::mutex  lock;
    std::deque<Handler> handlers;
    std::deque<Handler> notified;
    uint64_t            next_serial = 1;
    bool                drained     = false;

    auto add_handler(uint32_t kind, uint32_t id, EventCallback callback) -> std::optional<uint64_t>;
    auto remove_handler(uint64_t serial) -> bool;

  public:
    // register_callback and wait_for are exclusive
    auto register_callback(uint32_t kind, uint32_t id, EventCallback callback) -> bool;
    auto wait_for(uint32_t kind, uint32_t id = no_id, std::optional<std::chrono::milliseconds> timeout = std::nullopt) -> std::optional<uint32_t>;
    auto invoke(uint32_t kind, uint32_t id, uint32_t value) -> void;
    auto drain() -> bool;
    auto is_drained() const -> bool;
};
} // namespace sdrop
