/**
 * @file waiting_queue.hpp
 * @brief FIFO of tasks waiting for host resources.
 * @author Dimitris Kafetzis
 *
 * Waiting is data-structure membership only: no thread blocks on the
 * queue. Every operation takes the single queue lock.
 */

#pragma once

#include "api/task.hpp"
#include "core/types.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace node_agent {

class WaitingQueue {
public:
    struct Entry {
        std::shared_ptr<Task> task;
        SteadyTime enqueued_at;
    };

    WaitingQueue() = default;

    WaitingQueue(const WaitingQueue&) = delete;
    WaitingQueue& operator=(const WaitingQueue&) = delete;

    /// Append to the back. Returns false if the task is already queued.
    bool enqueue(std::shared_ptr<Task> task);

    [[nodiscard]] std::shared_ptr<Task> peek_front() const;

    /// Remove and return the front entry (nullptr when empty).
    std::shared_ptr<Task> dequeue();

    /// Remove @p arn wherever it is, keeping the order of the others.
    bool remove(const TaskArn& arn);

    [[nodiscard]] bool contains(const TaskArn& arn) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

    /// Queued ARNs in dequeue order.
    [[nodiscard]] std::vector<TaskArn> arns() const;

private:
    std::deque<Entry> entries_;
    mutable std::mutex mutex_;
};

}  // namespace node_agent
