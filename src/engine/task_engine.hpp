/**
 * @file task_engine.hpp
 * @brief Top-level TaskEngine facade: task registry, admission and persistence.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Adding and updating tasks received from the control plane
 *   2. Admitting tasks against host capacity in FIFO order
 *   3. Streaming state-change events to the reporter
 *   4. Saving and restoring the registry across agent restarts
 *
 * Every task that reaches a managed state gets a ManagedTask. Tasks that
 * are refused up front (invalid definition, impossible requirements,
 * stopped before admission) also get one, with desired status STOPPED, so
 * their STOPPED event and cleanup follow the ordinary path without ever
 * touching the ledger or the runtime.
 */

#pragma once

#include "api/statechange.hpp"
#include "api/task.hpp"
#include "core/channel.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "engine/container_transition.hpp"
#include "engine/managed_task.hpp"
#include "engine/resource_ledger.hpp"
#include "engine/waiting_queue.hpp"
#include "executor/call_executor.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/runtime_driver.hpp"
#include "state/state_store.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

namespace node_agent {

inline constexpr std::string_view kAgentVersion = "1.0.0";

class TaskEngine {
public:
    struct Options {
        Config config;
        ResourceRequirements capacity;
        IRuntimeDriver& driver;
        IResourceProvisioner& provisioner;
        Logger& logger;
    };

    explicit TaskEngine(Options opts);
    ~TaskEngine();

    // Non-copyable, non-movable
    TaskEngine(const TaskEngine&) = delete;
    TaskEngine& operator=(const TaskEngine&) = delete;

    // ── Lifecycle ────────────────────────────

    /// Start the periodic state saver (when persistence is enabled).
    Result<void> start();

    /// Cancel every task loop and pending runtime call, join, and save state.
    void shutdown();

    // ── Task intake ──────────────────────────

    /**
     * @brief Add a new task, or update the desired status of a known one.
     *
     * A definition with an invalid dependency graph, or whose requirements
     * can never fit this host, is stopped immediately with a descriptive
     * reason and the error is returned. A known task moved to STOPPED while
     * still waiting for resources leaves the queue and stops without
     * starting anything.
     */
    Result<void> add_task(TaskDefinition definition);

    // ── Queries ──────────────────────────────

    /// Registered tasks in arrival order.
    [[nodiscard]] std::vector<std::shared_ptr<Task>> list_tasks() const;

    /// nullptr if @p arn is not registered.
    [[nodiscard]] std::shared_ptr<Task> task_by_arn(const TaskArn& arn) const;

    /// Events for the external reporter, in hand-off order.
    [[nodiscard]] Channel<StateChangeEvent>& events() noexcept { return events_; }

    [[nodiscard]] std::string_view version() const noexcept { return kAgentVersion; }

    /// Front of the waiting queue, nullptr when nothing is waiting.
    [[nodiscard]] std::shared_ptr<Task> top_task() const;

    [[nodiscard]] size_t managed_task_count() const;
    [[nodiscard]] size_t waiting_count() const;

    [[nodiscard]] const ResourceLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    // ── Persistence ──────────────────────────

    Result<void> save_state();

    /**
     * @brief Rebuild the registry from the state file.
     *
     * Must be called before any task is added. The ledger snapshot is
     * restored verbatim, waiting tasks are re-queued in their saved order
     * and every admitted task resumes from its saved statuses. A missing
     * state file is not an error.
     */
    Result<void> load_state();

private:
    ManagedTaskHooks make_hooks();

    /// Register and start the control loop for @p task. Caller holds mutex_.
    void launch_locked(const std::shared_ptr<Task>& task);

    /// Stop @p task without admitting it. Caller holds mutex_.
    void stop_unadmitted_locked(const std::shared_ptr<Task>& task, const std::string& reason);

    /// Admit queued tasks from the front while they fit. Caller holds mutex_.
    void admit_waiting_locked();

    void on_task_stopped(const TaskArn& arn);
    void on_task_cleaned(const TaskArn& arn);

    /// Join loops of cleaned tasks outside the engine lock.
    void reap_retired();

    void saver_loop(std::stop_token stop);

    Config config_;
    Logger& logger_;
    IResourceProvisioner& provisioner_;

    CallExecutor executor_;
    ContainerTransitioner transitioner_;
    ResourceLedger ledger_;
    WaitingQueue waiting_;
    StateStore store_;
    ManagedTaskSettings settings_;
    Channel<StateChangeEvent> events_;

    mutable std::mutex mutex_;
    std::map<TaskArn, std::shared_ptr<Task>> tasks_;
    std::vector<TaskArn> arrival_order_;
    std::map<TaskArn, std::unique_ptr<ManagedTask>> managed_;
    std::vector<std::unique_ptr<ManagedTask>> retired_;
    bool shutting_down_{false};

    std::mutex save_mutex_;
    std::atomic<bool> dirty_{false};
    std::mutex saver_mutex_;
    std::condition_variable_any saver_cv_;
    std::jthread saver_;
};

}  // namespace node_agent
