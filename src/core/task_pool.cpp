#include "core/task_pool.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace warden::core {

TaskPool::TaskPool(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

TaskPool::~TaskPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
        if (!queue_.empty() || !delayed_.empty()) {
            spdlog::debug("TaskPool dropping {} queued tasks", queue_.size() + delayed_.size());
            queue_.clear();
            delayed_.clear();
        }
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool TaskPool::submit(TaskFn task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool TaskPool::submit_after(std::chrono::milliseconds delay, TaskFn task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return false;
        }
        delayed_.emplace(std::chrono::steady_clock::now() + delay, std::move(task));
    }
    // Idle workers recompute their wake-up time
    queue_cv_.notify_all();
    return true;
}

void TaskPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && delayed_.empty() && active_ == 0; });
}

void TaskPool::promote_due_locked(TimePoint now) {
    auto due_end = delayed_.upper_bound(now);
    for (auto it = delayed_.begin(); it != due_end; ++it) {
        queue_.push_back(std::move(it->second));
    }
    delayed_.erase(delayed_.begin(), due_end);
}

void TaskPool::worker_loop() {
    while (true) {
        TaskFn task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            while (true) {
                if (stopping_) {
                    return;
                }
                promote_due_locked(std::chrono::steady_clock::now());
                if (!queue_.empty()) {
                    break;
                }
                if (delayed_.empty()) {
                    queue_cv_.wait(lock);
                } else {
                    TimePoint wake = delayed_.begin()->first;
                    queue_cv_.wait_until(lock, wake);
                }
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}

} // namespace warden::core
