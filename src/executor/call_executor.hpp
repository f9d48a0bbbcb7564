/**
 * @file call_executor.hpp
 * @brief std::jthread-based worker pool that runs runtime calls with deadlines.
 * @author Dimitris Kafetzis
 *
 * A task's control loop never blocks on the runtime driver directly: it
 * submits the call here and waits for its completion, bounded by the
 * operation's timeout and by the loop's own stop_token. The wait is
 * interruptible, so a stop request wakes the caller at once. Each call gets its own
 * stop_source, signalled on timeout, on caller cancellation and on pool
 * shutdown, so a cooperative driver returns promptly in every case.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace node_agent {

class CallExecutor {
public:
    explicit CallExecutor(size_t num_threads = 0);
    ~CallExecutor();

    // Non-copyable, non-movable
    CallExecutor(const CallExecutor&) = delete;
    CallExecutor& operator=(const CallExecutor&) = delete;

    /**
     * @brief Run @p func on a worker and wait at most @p timeout for it.
     *
     * @param operation  Name used in Timeout/Cancelled messages, e.g. "MANIFEST_PULLED".
     * @return The call's own result, or ErrorKind::Timeout when the deadline
     *         passes, or ErrorKind::Cancelled when @p caller_stop fires first.
     *         A non-positive timeout fails immediately without running the call.
     */
    template <DriverCall F>
    std::invoke_result_t<F, std::stop_token> run_bounded(F&& func, Duration timeout,
                                                         std::stop_token caller_stop,
                                                         std::string_view operation);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    /// Completion slot shared between a waiting caller and the worker running its call.
    template <typename R>
    struct PendingCall {
        std::mutex mutex;
        std::condition_variable_any done_cv;
        std::optional<R> result;
        std::exception_ptr failure;
        bool done{false};
    };

    void enqueue(std::function<void(std::stop_token)> job);
    void worker_loop(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_jobs_{0};
};

/// "could not transition to <operation>; timed out after <ms>ms"
[[nodiscard]] std::string timeout_message(std::string_view operation, Duration timeout);

// ── Template implementations ─────────────────

template <DriverCall F>
std::invoke_result_t<F, std::stop_token> CallExecutor::run_bounded(F&& func, Duration timeout,
                                                                   std::stop_token caller_stop,
                                                                   std::string_view operation) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;

    if (timeout <= Duration::zero()) {
        return ReturnType(Error(ErrorKind::Timeout, timeout_message(operation, timeout)));
    }
    if (caller_stop.stop_requested()) {
        return ReturnType(Error(ErrorKind::Cancelled,
                                "could not transition to " + std::string(operation) + "; cancelled"));
    }

    std::stop_source call_stop;
    auto pending = std::make_shared<PendingCall<ReturnType>>();

    enqueue([pending, f = std::forward<F>(func), source = call_stop](
                std::stop_token worker_stop) mutable {
        std::stop_callback link(worker_stop, [&source] { source.request_stop(); });
        std::optional<ReturnType> result;
        std::exception_ptr failure;
        try {
            result.emplace(f(source.get_token()));
        } catch (...) {
            failure = std::current_exception();
        }
        {
            std::lock_guard lock(pending->mutex);
            pending->result = std::move(result);
            pending->failure = failure;
            pending->done = true;
        }
        pending->done_cv.notify_all();
    });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock lock(pending->mutex);
        // Returns early when caller_stop fires; the stop_token overload registers
        // its own stop_callback on the condition variable.
        if (pending->done_cv.wait_until(lock, caller_stop, deadline,
                                        [&pending] { return pending->done; })) {
            if (pending->failure) std::rethrow_exception(pending->failure);
            return std::move(*pending->result);
        }
    }

    call_stop.request_stop();
    if (caller_stop.stop_requested()) {
        return ReturnType(Error(ErrorKind::Cancelled,
                                "could not transition to " + std::string(operation) + "; cancelled"));
    }
    return ReturnType(Error(ErrorKind::Timeout, timeout_message(operation, timeout)));
}

}  // namespace node_agent
