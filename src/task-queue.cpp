#include "task-queue.hpp"
#include "macros/logger.hpp"
#include "util/event.hpp"

namespace {
auto logger = Logger("sdrop_task_queue");
}

namespace sdrop {
auto TaskQueue::worker_main() -> void {
    while(true) {
        auto task = Task();
        {
            auto guard = std::unique_lock(lock);
            cond.wait(guard, [this] { return !running || !tasks.empty(); });
            if(tasks.empty()) {
                return;
            }
            task = std::move(tasks.front());
            tasks.pop_front();
        }
        task();
    }
}

auto TaskQueue::start() -> void {
    auto guard = std::lock_guard(lock);
    if(running) {
        return;
    }
    running   = true;
    worker    = std::thread(&TaskQueue::worker_main, this);
    worker_id = worker.get_id();
}

auto TaskQueue::push(Task task) -> bool {
    auto guard = std::lock_guard(lock);
    if(!running) {
        return false;
    }
    tasks.push_back(std::move(task));
    cond.notify_one();
    return true;
}

auto TaskQueue::run_sync(Task task) -> void {
    if(is_worker_thread()) {
        task();
        return;
    }
    auto event   = Event();
    auto wrapped = [&task, &event] {
        task();
        event.notify();
    };
    if(!push(wrapped)) {
        task();
        return;
    }
    event.wait();
}

auto TaskQueue::is_worker_thread() const -> bool {
    auto guard = std::lock_guard(lock);
    return worker.joinable() && worker_id == std::this_thread::get_id();
}

auto TaskQueue::stop() -> void {
    {
        auto guard = std::lock_guard(lock);
        running    = false;
        cond.notify_all();
    }
    if(!worker.joinable()) {
        return;
    }
    if(worker_id == std::this_thread::get_id()) {
        LOG_ERROR(logger, "task queue stopped from its own worker");
        worker.detach();
        return;
    }
    worker.join();
}

TaskQueue::~TaskQueue() {
    stop();
}
} // namespace sdrop
