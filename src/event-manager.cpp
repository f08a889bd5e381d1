#include <algorithm>
#include <condition_variable>
#include <memory>
#include <utility>

#include "event-manager.hpp"
#include "macros/logger.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_ERROR(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_events");

// unconsumed notifications kept before the oldest is dropped
constexpr auto notified_limit = size_t(32);
} // namespace

namespace sdrop {
namespace {
auto eh_match(const uint32_t kind, const uint32_t id) -> auto {
    return [kind, id](const auto& h) { return h.kind == kind && h.id == id; };
}
} // namespace

auto Events::add_handler(const uint32_t kind, const uint32_t id, EventCallback callback) -> std::optional<uint64_t> {
    LOG_DEBUG(logger, "new event handler registered kind={} id={}", kind, id);

    auto value = std::optional<uint32_t>();
    {
        auto guard = std::lock_guard(lock);
        ensure(!drained, "event table already drained");
        if(const auto i = std::ranges::find_if(notified, eh_match(kind, id)); i != notified.end()) {
            value = i->value;
            notified.erase(i);
        } else {
            const auto serial = next_serial += 1;
            handlers.emplace_back(Handler{
                .kind     = kind,
                .id       = id,
                .value    = no_value,
                .serial   = serial,
                .callback = std::move(callback),
            });
            return serial;
        }
    }
    callback(*value);
    return 0;
}

auto Events::remove_handler(const uint64_t serial) -> bool {
    auto guard = std::lock_guard(lock);
    const auto i = std::ranges::find_if(handlers, [serial](const Handler& h) { return h.serial == serial; });
    if(i == handlers.end()) {
        return false;
    }
    handlers.erase(i);
    return true;
}

auto Events::register_callback(const uint32_t kind, const uint32_t id, EventCallback callback) -> bool {
    return add_handler(kind, id, std::move(callback)).has_value();
}

auto Events::wait_for(const uint32_t kind, const uint32_t id, const std::optional<std::chrono::milliseconds> timeout) -> std::optional<uint32_t> {
    struct Waiter {
        std::mutex              lock;
        std::condition_variable cond;
        std::optional<uint32_t> value;
    };

    const auto waiter = std::make_shared<Waiter>();
    const auto notify = [waiter](const uint32_t value) {
        auto guard    = std::lock_guard(waiter->lock);
        waiter->value = value;
        waiter->cond.notify_all();
    };
    unwrap(serial, add_handler(kind, id, notify));

    auto       guard = std::unique_lock(waiter->lock);
    const auto ready = [&waiter] { return waiter->value.has_value(); };
    if(!timeout) {
        waiter->cond.wait(guard, ready);
    } else if(!waiter->cond.wait_for(guard, *timeout, ready)) {
        guard.unlock();
        if(remove_handler(serial)) {
            bail("timed out waiting for event kind={} id={}", kind, id);
        }
        // lost the race against invoke, the value is on its way
        guard.lock();
        waiter->cond.wait(guard, ready);
    }
    ensure(*waiter->value != drained_value, "drained while waiting for event kind={} id={}", kind, id);
    return waiter->value;
}

auto Events::invoke(const uint32_t kind, const uint32_t id, const uint32_t value) -> void {
    if(id != no_id) {
        LOG_DEBUG(logger, "new event kind={} id={} value={}", kind, id, value);
    } else {
        LOG_DEBUG(logger, "new event kind={} value={}", kind, value);
    }

    auto found = std::optional<Handler>();
    {
        auto guard = std::lock_guard(lock);
        if(drained) {
            return;
        }
        if(const auto i = std::ranges::find_if(handlers, eh_match(kind, id)); i != handlers.end()) {
            found = std::move(*i);
            handlers.erase(i);
        }
        if(!found) {
            if(notified.size() >= notified_limit) {
                LOG_WARN(logger, "event queue is full, dropping kind={} id={}", notified.front().kind, notified.front().id);
                notified.pop_front();
            }
            notified.emplace_back(Handler{.kind = kind, .id = id, .value = value, .serial = 0, .callback = {}});
            return;
        }
    }
    found->callback(value);
}

auto Events::drain() -> bool {
    LOG_DEBUG(logger, "draining...");

    {
        auto guard = std::lock_guard(lock);
        if(std::exchange(drained, true)) {
            return false;
        }
        notified.clear();
    }

loop:
    auto found = std::optional<Handler>();
    {
        auto guard = std::lock_guard(lock);
        if(handlers.empty()) {
            return true;
        }
        found = std::move(handlers.back());
        handlers.pop_back();
    }
    found->callback(drained_value);
    goto loop;
}

auto Events::is_drained() const -> bool {
    auto guard = std::lock_guard(lock);
    return drained;
}
} // namespace sdrop
