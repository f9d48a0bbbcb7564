/**
 * @file status.hpp
 * @brief Ordered container and task status enumerations.
 * @author Dimitris Kafetzis
 *
 * Both enumerations are totally ordered by their underlying value; every
 * component compares statuses with the built-in relational operators.
 * Container and task statuses are distinct types and never compared with
 * each other.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace node_agent {

// ─────────────────────────────────────────────
// Container Status
// ─────────────────────────────────────────────

enum class ContainerStatus : uint8_t {
    None,
    ManifestPulled,        ///< Image reference resolved to a digest
    Pulled,
    Created,
    Running,
    ResourcesProvisioned,  ///< Steady state of pause containers
    Stopped,
    Zombie                 ///< Removed from the runtime after cleanup
};

[[nodiscard]] constexpr std::string_view to_string(ContainerStatus status) noexcept {
    switch (status) {
        case ContainerStatus::None:                 return "NONE";
        case ContainerStatus::ManifestPulled:       return "MANIFEST_PULLED";
        case ContainerStatus::Pulled:               return "PULLED";
        case ContainerStatus::Created:              return "CREATED";
        case ContainerStatus::Running:              return "RUNNING";
        case ContainerStatus::ResourcesProvisioned: return "RESOURCES_PROVISIONED";
        case ContainerStatus::Stopped:              return "STOPPED";
        case ContainerStatus::Zombie:               return "ZOMBIE";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<ContainerStatus> parse_container_status(std::string_view text) noexcept;

/// Statuses the backend understands for containers.
[[nodiscard]] constexpr bool backend_recognized(ContainerStatus status) noexcept {
    return status == ContainerStatus::Running || status == ContainerStatus::Stopped;
}

/// A container status is reported once it reaches its steady state or stops.
[[nodiscard]] constexpr bool should_report_to_backend(ContainerStatus status,
                                                      ContainerStatus steady_state) noexcept {
    return status == steady_state || status == ContainerStatus::Stopped;
}

/**
 * @brief Map a known status to the status carried by a container event.
 *
 * Steady state is reported as RUNNING; MANIFEST_PULLED and STOPPED are
 * reported as-is; everything else maps to NONE (not reportable).
 */
[[nodiscard]] constexpr ContainerStatus reported_container_status(
    ContainerStatus known, ContainerStatus steady_state) noexcept {
    if (known == steady_state) return ContainerStatus::Running;
    if (known == ContainerStatus::ManifestPulled || known == ContainerStatus::Stopped) {
        return known;
    }
    return ContainerStatus::None;
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    None,
    ManifestPulled,
    Pulled,
    Created,
    Running,
    Stopped,
    Zombie
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::None:           return "NONE";
        case TaskStatus::ManifestPulled: return "MANIFEST_PULLED";
        case TaskStatus::Pulled:         return "PULLED";
        case TaskStatus::Created:        return "CREATED";
        case TaskStatus::Running:        return "RUNNING";
        case TaskStatus::Stopped:        return "STOPPED";
        case TaskStatus::Zombie:         return "ZOMBIE";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;

/// Statuses the backend understands for tasks. MANIFEST_PULLED is handled
/// separately because it is only reportable with a resolved digest.
[[nodiscard]] constexpr bool backend_recognized(TaskStatus status) noexcept {
    return status == TaskStatus::Running || status == TaskStatus::Stopped;
}

/// Desired container status implied by a desired task status.
[[nodiscard]] constexpr ContainerStatus to_container_status(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::None:           return ContainerStatus::None;
        case TaskStatus::ManifestPulled: return ContainerStatus::ManifestPulled;
        case TaskStatus::Pulled:         return ContainerStatus::Pulled;
        case TaskStatus::Created:        return ContainerStatus::Created;
        case TaskStatus::Running:        return ContainerStatus::Running;
        case TaskStatus::Stopped:        return ContainerStatus::Stopped;
        case TaskStatus::Zombie:         return ContainerStatus::Zombie;
    }
    return ContainerStatus::None;
}

// ─────────────────────────────────────────────
// Auxiliary statuses
// ─────────────────────────────────────────────

enum class HealthStatus : uint8_t { Unknown, Healthy, Unhealthy };

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Unknown:   return "UNKNOWN";
        case HealthStatus::Healthy:   return "HEALTHY";
        case HealthStatus::Unhealthy: return "UNHEALTHY";
    }
    return "UNKNOWN";
}

enum class ManagedAgentStatus : uint8_t { Pending, Running, Stopped };

[[nodiscard]] constexpr std::string_view to_string(ManagedAgentStatus status) noexcept {
    switch (status) {
        case ManagedAgentStatus::Pending: return "PENDING";
        case ManagedAgentStatus::Running: return "RUNNING";
        case ManagedAgentStatus::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool should_report_to_backend(ManagedAgentStatus status) noexcept {
    return status == ManagedAgentStatus::Running || status == ManagedAgentStatus::Stopped;
}

enum class AttachmentStatus : uint8_t { None, Attached, Detached };

[[nodiscard]] constexpr std::string_view to_string(AttachmentStatus status) noexcept {
    switch (status) {
        case AttachmentStatus::None:     return "NONE";
        case AttachmentStatus::Attached: return "ATTACHED";
        case AttachmentStatus::Detached: return "DETACHED";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<HealthStatus> parse_health_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<ManagedAgentStatus> parse_managed_agent_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<AttachmentStatus> parse_attachment_status(std::string_view text) noexcept;

}  // namespace node_agent
