#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace modelbridge {

/**
 * Single-worker FIFO queue. Everything posted here runs on one dedicated
 * thread, one item at a time, in arrival order.
 */
class DocumentExecutor {
public:
    using Task = std::function<void()>;

    DocumentExecutor();
    ~DocumentExecutor();

    DocumentExecutor(const DocumentExecutor&) = delete;
    DocumentExecutor& operator=(const DocumentExecutor&) = delete;

    /// Throws std::runtime_error once the executor is stopped.
    void post(Task task);

    /// Runs the remaining queued tasks, then joins the worker.
    void stop();

    bool is_running() const { return running_.load(); }

    /// True when called from the worker thread.
    bool on_worker_thread() const;

private:
    void worker_thread_func();

    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> running_{true};
    std::thread worker_;
};

} // namespace modelbridge
