/**
 * @file statechange.hpp
 * @brief State-change events handed to the external reporter.
 * @author Dimitris Kafetzis
 *
 * Factories decide whether an entity's current known status is eligible
 * for reporting. Ineligibility because of filtering (internal entities,
 * unresolved digests, statuses the backend does not track) is returned as
 * ErrorKind::ShouldNotSend; every other refusal is an ordinary error.
 */

#pragma once

#include "api/container.hpp"
#include "api/status.hpp"
#include "api/task.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace node_agent {

struct ContainerStateChange {
    TaskArn task_arn;
    ContainerName container_name;
    RuntimeId runtime_id;
    ContainerStatus status{ContainerStatus::None};
    std::string image_digest;
    std::string reason;
    std::optional<int> exit_code;
    std::vector<PortBinding> port_bindings;

    [[nodiscard]] Fields to_fields() const;
    [[nodiscard]] std::string to_string() const;
};

struct TaskStateChange {
    TaskArn task_arn;
    TaskStatus status{TaskStatus::None};
    std::string reason;
    std::optional<Timestamp> pull_started_at;
    std::optional<Timestamp> pull_stopped_at;
    std::optional<Timestamp> execution_stopped_at;

    [[nodiscard]] Fields to_fields() const;
    [[nodiscard]] std::string to_string() const;
};

struct ManagedAgentStateChange {
    TaskArn task_arn;
    ContainerName container_name;
    std::string name;
    ManagedAgentStatus status{ManagedAgentStatus::Pending};
    std::string reason;

    [[nodiscard]] Fields to_fields() const;
    [[nodiscard]] std::string to_string() const;
};

struct AttachmentStateChange {
    TaskArn task_arn;
    std::string attachment_arn;
    AttachmentStatus status{AttachmentStatus::None};

    [[nodiscard]] Fields to_fields() const;
    [[nodiscard]] std::string to_string() const;
};

using StateChangeEvent = std::variant<ContainerStateChange, TaskStateChange,
                                      ManagedAgentStateChange, AttachmentStateChange>;

// ─────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────

[[nodiscard]] Result<TaskStateChange> make_task_state_change(const Task& task, std::string reason);

[[nodiscard]] Result<ContainerStateChange> make_container_state_change(const Task& task,
                                                                       const Container& container,
                                                                       std::string reason);

[[nodiscard]] Result<ManagedAgentStateChange> make_managed_agent_state_change(
    const Task& task, const Container& container, const std::string& agent_name);

[[nodiscard]] Result<AttachmentStateChange> make_attachment_state_change(
    const Task& task, const Attachment& attachment);

// ─────────────────────────────────────────────
// Event helpers
// ─────────────────────────────────────────────

[[nodiscard]] const TaskArn& event_task_arn(const StateChangeEvent& event);
[[nodiscard]] Fields event_fields(const StateChangeEvent& event);
[[nodiscard]] std::string event_to_string(const StateChangeEvent& event);

/// ISO-8601 UTC with millisecond precision.
[[nodiscard]] std::string format_timestamp(Timestamp at);

}  // namespace node_agent
