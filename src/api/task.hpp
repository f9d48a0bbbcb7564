/**
 * @file task.hpp
 * @brief Task entity: a group of containers, resources and attachments.
 * @author Dimitris Kafetzis
 *
 * A task owns its containers exclusively. Task-level statuses live behind
 * the task's own mutex; container statuses behind each container's mutex.
 * The aggregate status is derived from container known statuses and is
 * only ever advanced, never regressed.
 */

#pragma once

#include "api/container.hpp"
#include "api/status.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace node_agent {

// ─────────────────────────────────────────────
// Task resources and attachments
// ─────────────────────────────────────────────

enum class TaskResourceKind : uint8_t { Volume, Secret, Credentials };

[[nodiscard]] constexpr std::string_view to_string(TaskResourceKind kind) noexcept {
    switch (kind) {
        case TaskResourceKind::Volume:      return "VOLUME";
        case TaskResourceKind::Secret:      return "SECRET";
        case TaskResourceKind::Credentials: return "CREDENTIALS";
    }
    return "UNKNOWN";
}

enum class TaskResourceStatus : uint8_t { None, Created, Removed };

[[nodiscard]] constexpr std::string_view to_string(TaskResourceStatus status) noexcept {
    switch (status) {
        case TaskResourceStatus::None:    return "NONE";
        case TaskResourceStatus::Created: return "CREATED";
        case TaskResourceStatus::Removed: return "REMOVED";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<TaskResourceKind> parse_task_resource_kind(std::string_view text) noexcept;
[[nodiscard]] std::optional<TaskResourceStatus> parse_task_resource_status(std::string_view text) noexcept;

struct TaskResource {
    std::string name;
    TaskResourceKind kind{TaskResourceKind::Volume};
    TaskResourceStatus status{TaskResourceStatus::None};

    bool operator==(const TaskResource&) const = default;
};

struct Attachment {
    std::string arn;
    std::string kind = "eni";
    AttachmentStatus status{AttachmentStatus::None};
    AttachmentStatus sent_status{AttachmentStatus::None};

    bool operator==(const Attachment&) const = default;
};

// ─────────────────────────────────────────────
// Definition and mutable state
// ─────────────────────────────────────────────

struct TaskDefinition {
    TaskArn arn;
    std::string family;
    std::string version;
    std::string launch_type = "EC2";
    TaskStatus desired_status{TaskStatus::Running};
    bool is_internal{false};
    uint32_t cpu_units{0};     ///< 0 = sum of container CPU
    uint64_t memory_mb{0};     ///< 0 = sum of container memory
    std::vector<ContainerDefinition> containers;
    std::vector<TaskResource> resources;
    std::vector<Attachment> attachments;
};

struct TaskState {
    TaskStatus known_status{TaskStatus::None};
    TaskStatus desired_status{TaskStatus::Running};
    TaskStatus sent_status{TaskStatus::None};
    std::string stop_reason;
    std::optional<Timestamp> pull_started_at;
    std::optional<Timestamp> pull_stopped_at;
    std::optional<Timestamp> execution_stopped_at;
    std::vector<TaskResource> resources;
    std::vector<Attachment> attachments;
};

// ─────────────────────────────────────────────
// Task
// ─────────────────────────────────────────────

class Task {
public:
    explicit Task(TaskDefinition definition);

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // ── Identity ─────────────────────────────
    [[nodiscard]] const TaskArn& arn() const noexcept { return arn_; }
    [[nodiscard]] const std::string& family() const noexcept { return family_; }
    [[nodiscard]] const std::string& version() const noexcept { return version_; }
    [[nodiscard]] const std::string& launch_type() const noexcept { return launch_type_; }
    [[nodiscard]] bool is_internal() const noexcept { return is_internal_; }

    /// CPU/memory (task level if declared, container sum otherwise) plus host ports.
    [[nodiscard]] const ResourceRequirements& requirements() const noexcept { return requirements_; }

    [[nodiscard]] const std::vector<std::shared_ptr<Container>>& containers() const noexcept {
        return containers_;
    }
    [[nodiscard]] std::shared_ptr<Container> container_by_name(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<Container> pause_container() const;

    // ── Statuses ─────────────────────────────

    [[nodiscard]] TaskStatus known_status() const;
    bool advance_known_status(TaskStatus status);

    [[nodiscard]] TaskStatus desired_status() const;
    bool set_desired_status(TaskStatus status);

    [[nodiscard]] TaskStatus sent_status() const;
    bool set_sent_status(TaskStatus status);

    [[nodiscard]] std::string stop_reason() const;
    /// Keeps the first reason given.
    void set_stop_reason(std::string reason);

    // ── Aggregation ──────────────────────────

    /// Task status implied by the current container known statuses.
    [[nodiscard]] TaskStatus compute_aggregate_status() const;

    /// Advance known status to the aggregate; returns true on change.
    bool update_known_from_containers();

    /**
     * @brief Force every container toward STOPPED once an essential one stopped.
     *
     * Sets the task desired status and every container's desired status to
     * STOPPED. Returns true if any desired status changed.
     */
    bool propagate_essential_stop();

    /// Push a STOPPED desired task status down to every container.
    bool propagate_desired_stop();

    [[nodiscard]] bool has_container_with_resolved_digest() const;

    // ── Resources and attachments ────────────

    [[nodiscard]] std::vector<TaskResource> resources() const;
    void set_resource_status(const std::string& name, TaskResourceStatus status);
    [[nodiscard]] bool resources_created() const;

    [[nodiscard]] std::vector<Attachment> attachments() const;
    void set_attachment_status(const std::string& arn, AttachmentStatus status);
    void set_attachment_sent_status(const std::string& arn, AttachmentStatus status);

    // ── Timestamps ───────────────────────────

    [[nodiscard]] std::optional<Timestamp> pull_started_at() const;
    [[nodiscard]] std::optional<Timestamp> pull_stopped_at() const;
    [[nodiscard]] std::optional<Timestamp> execution_stopped_at() const;
    void mark_pull_started(Timestamp at);
    void mark_pull_stopped(Timestamp at);
    void mark_execution_stopped(Timestamp at);

    [[nodiscard]] TaskState snapshot() const;
    void restore(const TaskState& state);

    /// Rebuild the definition (for persistence).
    [[nodiscard]] TaskDefinition definition() const;

private:
    const TaskArn arn_;
    const std::string family_;
    const std::string version_;
    const std::string launch_type_;
    const bool is_internal_;
    const uint32_t declared_cpu_units_;
    const uint64_t declared_memory_mb_;
    ResourceRequirements requirements_;
    std::vector<std::shared_ptr<Container>> containers_;

    mutable std::mutex mutex_;
    TaskState state_;
};

}  // namespace node_agent
