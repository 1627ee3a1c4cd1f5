#include "runtime/executor.hpp"
#include <spdlog/spdlog.h>

namespace foreman::runtime {

BackgroundExecutor::BackgroundExecutor(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = 1;
    }
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

BackgroundExecutor::~BackgroundExecutor() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool BackgroundExecutor::submit(std::string label, TaskFn task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            spdlog::warn("Dropping background task '{}': executor shutting down", label);
            return false;
        }
        queue_.push_back(Task{std::move(label), std::move(task)});
    }
    queue_cv_.notify_one();
    return true;
}

void BackgroundExecutor::drain() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this]() { return queue_.empty() && active_ == 0; });
}

size_t BackgroundExecutor::pending() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size() + active_;
}

void BackgroundExecutor::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
            active_++;
        }

        try {
            task.fn();
        } catch (const std::exception& e) {
            spdlog::error("Background task '{}' failed: {}", task.label, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_--;
            if (queue_.empty() && active_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace foreman::runtime
