#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace foreman::runtime {

// Fixed pool of threads running fire-and-forget jobs (auto-saves, evictions).
// Jobs still queued at destruction are run before the threads exit.
class BackgroundExecutor {
public:
    using TaskFn = std::function<void()>;

    explicit BackgroundExecutor(size_t worker_count = 2);
    ~BackgroundExecutor();

    BackgroundExecutor(const BackgroundExecutor&) = delete;
    BackgroundExecutor& operator=(const BackgroundExecutor&) = delete;

    // Queue a job; returns false once shutdown has begun.
    bool submit(std::string label, TaskFn task);

    // Block until the queue is empty and no job is running.
    // Must not be called from inside a job.
    void drain();

    size_t pending() const;

private:
    struct Task {
        std::string label;
        TaskFn fn;
    };

    void worker_loop();

    std::deque<Task> queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;
    std::vector<std::thread> workers_;
    std::atomic<bool> stopping_{false};
};

} // namespace foreman::runtime
