#include "document_executor.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <stdexcept>

namespace modelbridge {

DocumentExecutor::DocumentExecutor()
    : worker_(&DocumentExecutor::worker_thread_func, this) {}

DocumentExecutor::~DocumentExecutor() {
    stop();
}

void DocumentExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            throw std::runtime_error("document executor is stopped");
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
}

void DocumentExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool DocumentExecutor::on_worker_thread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void DocumentExecutor::worker_thread_func() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !running_; });

            if (!running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(host_logger(), "Document task failed: " << e.what());
        }
    }
}

} // namespace modelbridge
