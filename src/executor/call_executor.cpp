/**
 * @file call_executor.cpp
 * @brief CallExecutor worker management.
 * @author Dimitris Kafetzis
 */

#include "executor/call_executor.hpp"

namespace node_agent {

std::string timeout_message(std::string_view operation, Duration timeout) {
    return "could not transition to " + std::string(operation) + "; timed out after " +
           std::to_string(timeout.count()) + "ms";
}

CallExecutor::CallExecutor(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

CallExecutor::~CallExecutor() {
    // Request stop on all jthreads first; the stop propagates into running calls
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
}

void CallExecutor::enqueue(std::function<void(std::stop_token)> job) {
    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void CallExecutor::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void(std::stop_token)> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !job_queue_.empty(); });

            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
        }

        ++active_jobs_;
        job(stop);
        --active_jobs_;
    }
}

size_t CallExecutor::active_count() const noexcept {
    return active_jobs_.load();
}

size_t CallExecutor::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t CallExecutor::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace node_agent
