#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace sdrop {
// single worker thread running posted tasks in order
class TaskQueue {
  private:
    using Task = std::function<void()>;

    mutable std::mutex      lock;
    std::condition_variable cond;
    std::deque<Task>        tasks;
    bool                    running = false;
    std::thread             worker;
    std::thread::id         worker_id;

    auto worker_main() -> void;

  public:
    auto start() -> void;
    // false if the queue is not running
    auto push(Task task) -> bool;
    // waits for the task to finish, runs it inline on the worker or when not running
    auto run_sync(Task task) -> void;
    auto is_worker_thread() const -> bool;
    // runs the tasks already queued, then joins the worker
    auto stop() -> void;

    ~TaskQueue();
};
} // namespace sdrop
