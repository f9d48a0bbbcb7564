/**
 * @file task_engine.cpp
 * @brief TaskEngine registry, FIFO admission and persistence.
 * @author Dimitris Kafetzis
 */

#include "engine/task_engine.hpp"

#include "engine/dependency_graph.hpp"

#include <algorithm>

namespace node_agent {

namespace {

std::string describe(const ResourceRequirements& reqs) {
    std::string text = "cpu=" + std::to_string(reqs.cpu_units) +
                       " memory_mb=" + std::to_string(reqs.memory_mb);
    if (!reqs.ports.empty()) {
        text += " ports=";
        for (size_t i = 0; i < reqs.ports.size(); ++i) {
            if (i > 0) text += ',';
            text += std::to_string(reqs.ports[i]);
        }
    }
    return text;
}

}  // namespace

TaskEngine::TaskEngine(Options opts)
    : config_(std::move(opts.config))
    , logger_(opts.logger)
    , provisioner_(opts.provisioner)
    , executor_(config_.engine.runtime_workers)
    , transitioner_(opts.driver, opts.provisioner, executor_,
                    TransitionTimeouts::from_config(config_.engine), logger_)
    , ledger_(opts.capacity, config_.resources.exempt_launch_types)
    , store_(config_.agent.data_dir)
    , settings_(ManagedTaskSettings::from_config(config_.engine)) {
}

TaskEngine::~TaskEngine() {
    shutdown();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> TaskEngine::start() {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
        return Error{ErrorKind::Cancelled, "task engine has been shut down"};
    }
    if (saver_.joinable()) {
        return Error{"Already running"};
    }

    logger_.info("Task engine starting", {
        {"version", std::string(kAgentVersion)},
        {"capacity", describe(ledger_.capacity())},
        {"workers", std::to_string(executor_.thread_count())},
    });

    if (config_.agent.persist_state && config_.agent.state_save_interval_ms > 0) {
        saver_ = std::jthread([this](std::stop_token stop) { saver_loop(stop); });
    }
    return {};
}

void TaskEngine::shutdown() {
    std::map<TaskArn, std::unique_ptr<ManagedTask>> running;
    std::vector<std::unique_ptr<ManagedTask>> retired;
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) return;
        shutting_down_ = true;
        running.swap(managed_);
        retired.swap(retired_);
    }

    logger_.info("Task engine shutting down", {{"managed_tasks", std::to_string(running.size())}});

    if (saver_.joinable()) {
        saver_.request_stop();
        saver_.join();
    }

    // Cancels pending runtime calls; every loop returns within one wait slice.
    for (auto& [arn, managed] : running) {
        managed->stop_and_join();
    }
    running.clear();
    retired.clear();

    if (config_.agent.persist_state) {
        if (auto saved = save_state(); !saved) {
            logger_.error("Could not save state at shutdown", {{"error", saved.error().message}});
        }
    }

    events_.close();
    logger_.info("Task engine stopped");
}

void TaskEngine::saver_loop(std::stop_token stop) {
    const Duration interval{config_.agent.state_save_interval_ms};
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(saver_mutex_);
            saver_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;

        reap_retired();
        if (!dirty_.exchange(false)) continue;
        if (auto saved = save_state(); !saved) {
            logger_.warn("Periodic state save failed", {{"error", saved.error().message}});
            dirty_ = true;
        }
    }
}

// ─────────────────────────────────────────────
// Task intake
// ─────────────────────────────────────────────

Result<void> TaskEngine::add_task(TaskDefinition definition) {
    reap_retired();

    std::lock_guard lock(mutex_);
    if (shutting_down_) {
        return Error{ErrorKind::Cancelled, "task engine is shutting down"};
    }

    // Known task: only the desired status can change.
    if (auto it = tasks_.find(definition.arn); it != tasks_.end()) {
        const auto& task = it->second;
        const auto desired = definition.desired_status;
        if (auto managed = managed_.find(task->arn()); managed != managed_.end()) {
            managed->second->update_desired_status(desired);
        } else if (desired >= TaskStatus::Stopped && waiting_.remove(task->arn())) {
            logger_.info("Task stopped before admission", {{"task", task->arn()}});
            stop_unadmitted_locked(task, {});
        } else {
            task->set_desired_status(desired);
        }
        dirty_ = true;
        return {};
    }

    // Nothing to run and nothing to report: refuse without registering.
    if (definition.containers.empty()) {
        logger_.error("Task has no containers", {{"task", definition.arn}});
        return Error{ErrorKind::Configuration, "task " + definition.arn + " has no containers"};
    }

    auto validation = validate_dependencies(definition.containers);

    auto task = std::make_shared<Task>(std::move(definition));
    const TaskArn arn = task->arn();
    tasks_.emplace(arn, task);
    arrival_order_.push_back(arn);
    dirty_ = true;

    logger_.info("Task added", {
        {"task", arn},
        {"family", task->family() + ":" + task->version()},
        {"desired", std::string(to_string(task->desired_status()))},
        {"requires", describe(task->requirements())},
    });

    if (!validation) {
        logger_.error("Invalid task definition", {{"task", arn}, {"error", validation.error().message}});
        stop_unadmitted_locked(task, validation.error().message);
        return validation.error();
    }

    if (task->desired_status() >= TaskStatus::Stopped) {
        stop_unadmitted_locked(task, {});
        return {};
    }

    if (!ledger_.can_ever_fit(task->launch_type(), task->requirements())) {
        const std::string reason = "task requires " + describe(task->requirements()) +
                                   ", more than the host can ever provide (" +
                                   describe(ledger_.capacity()) + ")";
        logger_.error("Task can never be admitted", {{"task", arn}, {"reason", reason}});
        stop_unadmitted_locked(task, reason);
        return Error{ErrorKind::Configuration, reason};
    }

    // Exempt launch types consume nothing, so they never wait behind the queue.
    if (ledger_.is_exempt(task->launch_type()) ||
        (waiting_.empty() && ledger_.try_consume(arn, task->launch_type(), task->requirements()))) {
        launch_locked(task);
        return {};
    }

    waiting_.enqueue(task);
    logger_.info("Task waiting for host resources", {
        {"task", arn},
        {"position", std::to_string(waiting_.size())},
        {"available", describe(ledger_.available())},
    });
    return {};
}

ManagedTaskHooks TaskEngine::make_hooks() {
    return ManagedTaskHooks{
        .emit = [this](StateChangeEvent event) { return events_.send(std::move(event)); },
        .on_stopped = [this](const TaskArn& arn) { on_task_stopped(arn); },
        .on_cleaned = [this](const TaskArn& arn) { on_task_cleaned(arn); },
        .on_change = [this] { dirty_ = true; },
    };
}

void TaskEngine::launch_locked(const std::shared_ptr<Task>& task) {
    if (shutting_down_) return;
    auto managed = std::make_unique<ManagedTask>(task, transitioner_, provisioner_, executor_,
                                                 settings_, make_hooks(), logger_);
    auto* loop = managed.get();
    managed_[task->arn()] = std::move(managed);
    loop->start();
}

void TaskEngine::stop_unadmitted_locked(const std::shared_ptr<Task>& task,
                                        const std::string& reason) {
    if (!reason.empty()) task->set_stop_reason(reason);
    task->set_desired_status(TaskStatus::Stopped);
    task->propagate_desired_stop();
    launch_locked(task);
}

void TaskEngine::admit_waiting_locked() {
    if (shutting_down_) return;
    while (auto front = waiting_.peek_front()) {
        if (!ledger_.try_consume(front->arn(), front->launch_type(), front->requirements())) {
            logger_.debug("Head of waiting queue does not fit yet", {
                {"task", front->arn()},
                {"available", describe(ledger_.available())},
            });
            break;
        }
        waiting_.dequeue();
        logger_.info("Task admitted from waiting queue", {
            {"task", front->arn()},
            {"still_waiting", std::to_string(waiting_.size())},
        });
        launch_locked(front);
    }
}

void TaskEngine::on_task_stopped(const TaskArn& arn) {
    std::lock_guard lock(mutex_);
    if (ledger_.release(arn)) {
        logger_.info("Task stopped; host resources released", {
            {"task", arn},
            {"available", describe(ledger_.available())},
        });
    }
    dirty_ = true;
    admit_waiting_locked();
}

void TaskEngine::on_task_cleaned(const TaskArn& arn) {
    std::lock_guard lock(mutex_);
    ledger_.release(arn);
    tasks_.erase(arn);
    std::erase(arrival_order_, arn);
    if (auto it = managed_.find(arn); it != managed_.end()) {
        // Called on the task's own thread; joined later by reap_retired().
        retired_.push_back(std::move(it->second));
        managed_.erase(it);
    }
    dirty_ = true;
    admit_waiting_locked();
}

void TaskEngine::reap_retired() {
    std::vector<std::unique_ptr<ManagedTask>> done;
    {
        std::lock_guard lock(mutex_);
        done.swap(retired_);
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<std::shared_ptr<Task>> TaskEngine::list_tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<Task>> tasks;
    tasks.reserve(arrival_order_.size());
    for (const auto& arn : arrival_order_) {
        tasks.push_back(tasks_.at(arn));
    }
    return tasks;
}

std::shared_ptr<Task> TaskEngine::task_by_arn(const TaskArn& arn) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(arn);
    return it != tasks_.end() ? it->second : nullptr;
}

std::shared_ptr<Task> TaskEngine::top_task() const {
    return waiting_.peek_front();
}

size_t TaskEngine::managed_task_count() const {
    std::lock_guard lock(mutex_);
    return managed_.size();
}

size_t TaskEngine::waiting_count() const {
    return waiting_.size();
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<void> TaskEngine::save_state() {
    std::lock_guard save_lock(save_mutex_);

    PersistedState state;
    {
        std::lock_guard lock(mutex_);
        for (const auto& arn : arrival_order_) {
            state.tasks.push_back(make_task_record(*tasks_.at(arn)));
        }
        state.ledger = ledger_.snapshot();
        state.waiting = waiting_.arns();
    }

    auto saved = store_.save(state, kAgentVersion);
    if (!saved) return saved.error();

    logger_.debug("State saved", {
        {"file", store_.file().string()},
        {"tasks", std::to_string(state.tasks.size())},
    });
    return {};
}

Result<void> TaskEngine::load_state() {
    auto loaded = store_.load();
    if (!loaded) return loaded.error();
    if (!loaded->has_value()) {
        logger_.info("No saved state", {{"file", store_.file().string()}});
        return {};
    }
    const PersistedState& state = **loaded;

    std::lock_guard lock(mutex_);
    if (!tasks_.empty()) {
        return Error{ErrorKind::Internal, "state must be loaded before any task is added"};
    }

    if (!ledger_.restore(state.ledger)) {
        logger_.warn("Restored consumption exceeds host capacity; admission waits for releases", {
            {"capacity", describe(ledger_.capacity())},
            {"consumed", describe(ledger_.consumed())},
        });
    }

    for (const auto& record : state.tasks) {
        auto task = restore_task(record);
        if (task->known_status() >= TaskStatus::Zombie) {
            // Cleaned up but not yet removed when the state was saved.
            ledger_.release(task->arn());
            continue;
        }
        arrival_order_.push_back(task->arn());
        tasks_.emplace(task->arn(), std::move(task));
    }

    for (const auto& arn : state.waiting) {
        auto it = tasks_.find(arn);
        if (it == tasks_.end()) {
            logger_.warn("Saved waiting queue names an unknown task", {{"task", arn}});
            continue;
        }
        waiting_.enqueue(it->second);
    }

    for (const auto& arn : arrival_order_) {
        if (waiting_.contains(arn)) continue;
        launch_locked(tasks_.at(arn));
    }

    logger_.info("State restored", {
        {"file", store_.file().string()},
        {"tasks", std::to_string(tasks_.size())},
        {"waiting", std::to_string(waiting_.size())},
        {"consumed", describe(ledger_.consumed())},
    });

    admit_waiting_locked();
    return {};
}

}  // namespace node_agent
