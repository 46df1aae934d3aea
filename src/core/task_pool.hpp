#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace warden::core {

// Fixed-size worker pool for background work such as OAuth token polling.
// Delayed tasks wait in a timer queue without occupying a worker.
// Tasks still queued at destruction are dropped; running tasks are joined.
class TaskPool {
public:
    using TaskFn = std::function<void()>;

    explicit TaskPool(size_t worker_count = 2);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    bool submit(TaskFn task);

    // Run the task once the delay has elapsed. False when the pool is stopping.
    bool submit_after(std::chrono::milliseconds delay, TaskFn task);

    // Block until no task is queued, delayed or running
    void wait_idle();

    bool is_stopping() const { return stopping_; }

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    void worker_loop();

    // Move delayed tasks that are due onto the ready queue
    void promote_due_locked(TimePoint now);

    std::deque<TaskFn> queue_;
    std::multimap<TimePoint, TaskFn> delayed_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
    size_t active_ = 0;
};

} // namespace warden::core
