/**
 * @file waiting_queue.cpp
 * @brief WaitingQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/waiting_queue.hpp"

#include <algorithm>

namespace node_agent {

bool WaitingQueue::enqueue(std::shared_ptr<Task> task) {
    if (!task) return false;
    std::lock_guard lock(mutex_);
    const bool queued = std::any_of(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.task->arn() == task->arn();
    });
    if (queued) return false;
    entries_.push_back(Entry{std::move(task), std::chrono::steady_clock::now()});
    return true;
}

std::shared_ptr<Task> WaitingQueue::peek_front() const {
    std::lock_guard lock(mutex_);
    if (entries_.empty()) return nullptr;
    return entries_.front().task;
}

std::shared_ptr<Task> WaitingQueue::dequeue() {
    std::lock_guard lock(mutex_);
    if (entries_.empty()) return nullptr;
    auto task = std::move(entries_.front().task);
    entries_.pop_front();
    return task;
}

bool WaitingQueue::remove(const TaskArn& arn) {
    std::lock_guard lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& entry) { return entry.task->arn() == arn; });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool WaitingQueue::contains(const TaskArn& arn) const {
    std::lock_guard lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const Entry& entry) { return entry.task->arn() == arn; });
}

size_t WaitingQueue::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool WaitingQueue::empty() const {
    std::lock_guard lock(mutex_);
    return entries_.empty();
}

std::vector<TaskArn> WaitingQueue::arns() const {
    std::lock_guard lock(mutex_);
    std::vector<TaskArn> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.task->arn());
    }
    return result;
}

}  // namespace node_agent
