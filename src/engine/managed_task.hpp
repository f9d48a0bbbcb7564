/**
 * @file managed_task.hpp
 * @brief Per-task control loop driving containers toward their desired status.
 * @author Dimitris Kafetzis
 *
 * Each admitted task gets one ManagedTask with one std::jthread. Only that
 * thread mutates the task's and its containers' known and sent statuses.
 * Other threads talk to it through its inbox (desired-status updates) and
 * its stop_token (process shutdown).
 *
 * One pass of the loop:
 *   1. provision task resources that are still missing
 *   2. step every container once toward its target, honoring dependencies
 *      and per-container retry backoff
 *   3. inspect containers past RUNNING when the steady-state poll is due
 *   4. propagate an essential container's exit to the whole task
 *   5. aggregate container statuses into the task status
 *   6. hand eligible state-change events to the engine
 *
 * Once the task's STOPPED event has been handed off the loop waits the
 * cleanup duration, removes containers and resources, and reports itself
 * cleaned.
 */

#pragma once

#include "api/statechange.hpp"
#include "api/task.hpp"
#include "core/channel.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/container_transition.hpp"
#include "executor/call_executor.hpp"
#include "runtime/provisioner.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace node_agent {

struct ManagedTaskSettings {
    Duration steady_state_poll_interval{5000};
    Duration task_cleanup_wait{3 * 60 * 60 * 1000};
    uint32_t max_transition_attempts{3};
    Duration retry_backoff{1000};
    Duration resource_timeout{240000};

    static ManagedTaskSettings from_config(const EngineConfig& config);
};

/**
 * @brief Callbacks into the owning engine. All are invoked on the task's thread.
 */
struct ManagedTaskHooks {
    /// Hand an event to the reporter; false if it could not be accepted.
    std::function<bool(StateChangeEvent)> emit;
    /// The task's STOPPED status has been handed off.
    std::function<void(const TaskArn&)> on_stopped;
    /// Containers and resources are removed; the task may leave the registry.
    std::function<void(const TaskArn&)> on_cleaned;
    /// Task state changed and should be persisted.
    std::function<void()> on_change;
};

class ManagedTask {
public:
    ManagedTask(std::shared_ptr<Task> task, ContainerTransitioner& transitioner,
                IResourceProvisioner& provisioner, CallExecutor& executor,
                ManagedTaskSettings settings, ManagedTaskHooks hooks, Logger& logger);
    ~ManagedTask();

    ManagedTask(const ManagedTask&) = delete;
    ManagedTask& operator=(const ManagedTask&) = delete;

    /// Launch the control loop thread.
    void start();

    /// Deliver a new desired status (from the control plane or the engine).
    void update_desired_status(TaskStatus desired);

    /// Cancel the loop and any pending runtime call, then join.
    void stop_and_join();

    [[nodiscard]] const std::shared_ptr<Task>& task() const noexcept { return task_; }
    [[nodiscard]] bool finished() const noexcept { return finished_.load(); }

private:
    struct RetryState {
        ContainerStatus step{ContainerStatus::None};
        uint32_t attempts{0};
        SteadyTime not_before{};
    };

    void run(std::stop_token stop);
    void apply_desired(TaskStatus desired);

    /// One control loop pass; returns true if anything changed.
    bool pass(std::stop_token stop, bool poll_due);

    bool provision_resources(std::stop_token stop);
    bool mark_attachments();
    bool progress_container(Container& container, std::stop_token stop);
    void fail_container(Container& container, ContainerStatus step, const Error& error);
    void after_step(Container& container, ContainerStatus status);
    bool poll_steady_state(std::stop_token stop);
    bool propagate_essential_exit();
    void update_pull_stopped();

    void emit_events();
    bool emit(StateChangeEvent event);

    void cleanup(std::stop_token stop);

    [[nodiscard]] SteadyTime next_wakeup(SteadyTime next_poll) const;
    [[nodiscard]] bool stopped_event_sent() const;

    std::shared_ptr<Task> task_;
    ContainerTransitioner& transitioner_;
    IResourceProvisioner& provisioner_;
    CallExecutor& executor_;
    ManagedTaskSettings settings_;
    ManagedTaskHooks hooks_;
    Logger& logger_;

    // Owned by the loop thread
    std::map<std::string, RetryState> retries_;
    std::map<ContainerName, ContainerStatus> last_evaluated_;
    TaskStatus last_evaluated_task_{TaskStatus::None};
    bool cancelled_{false};

    Channel<TaskStatus> inbox_;
    std::atomic<bool> finished_{false};
    std::jthread thread_;
};

}  // namespace node_agent
