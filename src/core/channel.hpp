/**
 * @file channel.hpp
 * @brief Unbounded multi-producer message channel with stop_token-aware waits.
 * @author Dimitris Kafetzis
 *
 * Used as the inbox of each managed task and as the engine's outbound
 * state-change event stream.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace node_agent {

template <typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Returns false if the channel has been closed.
    bool send(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Block until a value is available, the channel closes, or @p stop fires.
    std::optional<T> receive(std::stop_token stop) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, stop, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    /// Block until a value is available or @p deadline passes.
    std::optional<T> receive_until(std::chrono::steady_clock::time_point deadline,
                                   std::stop_token stop = {}) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, stop, deadline, [this] { return !queue_.empty() || closed_; });
        return pop_locked();
    }

    template <typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout,
                                 std::stop_token stop = {}) {
        return receive_until(std::chrono::steady_clock::now() + timeout, stop);
    }

    std::optional<T> try_receive() {
        std::lock_guard lock(mutex_);
        return pop_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> pop_locked() {
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    std::deque<T> queue_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace node_agent
