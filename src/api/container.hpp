/**
 * @file container.hpp
 * @brief Container entity: immutable definition plus synchronized runtime state.
 * @author Dimitris Kafetzis
 *
 * Only the owning task's control loop mutates a container; every other
 * reader (event construction, persistence, diagnostics) goes through the
 * locked getters so it never observes a half-updated status.
 */

#pragma once

#include "api/status.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace node_agent {

// ─────────────────────────────────────────────
// Container kinds
// ─────────────────────────────────────────────

enum class ContainerKind : uint8_t {
    Normal,
    Pause,          ///< Holds the task network namespace
    ManagedDaemon   ///< Agent-managed helper, never reported
};

[[nodiscard]] constexpr std::string_view to_string(ContainerKind kind) noexcept {
    switch (kind) {
        case ContainerKind::Normal:        return "NORMAL";
        case ContainerKind::Pause:         return "PAUSE";
        case ContainerKind::ManagedDaemon: return "MANAGED_DAEMON";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<ContainerKind> parse_container_kind(std::string_view text) noexcept;

[[nodiscard]] constexpr ContainerStatus steady_state_status(ContainerKind kind) noexcept {
    switch (kind) {
        case ContainerKind::Normal:        return ContainerStatus::Running;
        case ContainerKind::Pause:         return ContainerStatus::ResourcesProvisioned;
        case ContainerKind::ManagedDaemon: return ContainerStatus::Running;
    }
    return ContainerStatus::Running;
}

/// Internal containers never produce backend events.
[[nodiscard]] constexpr bool is_internal(ContainerKind kind) noexcept {
    switch (kind) {
        case ContainerKind::Normal:        return false;
        case ContainerKind::Pause:         return true;
        case ContainerKind::ManagedDaemon: return true;
    }
    return false;
}

// ─────────────────────────────────────────────
// Dependencies
// ─────────────────────────────────────────────

enum class DependencyCondition : uint8_t {
    Start,      ///< Dependency has been started
    Complete,   ///< Dependency has stopped (any exit code)
    Success,    ///< Dependency has stopped with exit code 0
    Healthy     ///< Dependency reports a healthy health check
};

[[nodiscard]] constexpr std::string_view to_string(DependencyCondition condition) noexcept {
    switch (condition) {
        case DependencyCondition::Start:    return "START";
        case DependencyCondition::Complete: return "COMPLETE";
        case DependencyCondition::Success:  return "SUCCESS";
        case DependencyCondition::Healthy:  return "HEALTHY";
    }
    return "UNKNOWN";
}

/// Case-insensitive parse ("complete", "COMPLETE").
[[nodiscard]] std::optional<DependencyCondition> parse_dependency_condition(std::string_view text);

struct DependsOn {
    ContainerName container_name;
    DependencyCondition condition{DependencyCondition::Start};

    bool operator==(const DependsOn&) const = default;
};

struct PortBinding {
    uint16_t container_port{0};
    uint16_t host_port{0};
    std::string protocol = "tcp";

    bool operator==(const PortBinding&) const = default;
};

struct ManagedAgent {
    std::string name;
    ManagedAgentStatus status{ManagedAgentStatus::Pending};
    ManagedAgentStatus sent_status{ManagedAgentStatus::Pending};
    std::string reason;

    bool operator==(const ManagedAgent&) const = default;
};

// ─────────────────────────────────────────────
// Definition and mutable state
// ─────────────────────────────────────────────

/**
 * @brief Immutable part of a container, as received in the task definition.
 */
struct ContainerDefinition {
    ContainerName name;
    std::string image;
    ContainerKind kind{ContainerKind::Normal};
    bool essential{true};
    std::vector<DependsOn> depends_on;
    std::vector<PortBinding> port_bindings;
    uint32_t cpu_units{0};
    uint64_t memory_mb{0};
    std::vector<std::string> command;
    std::optional<Duration> stop_timeout;        ///< Overrides the engine default
    std::vector<std::string> managed_agents;     ///< Names of agents running inside
};

/**
 * @brief Snapshot of the mutable part of a container (persistence, restore).
 */
struct ContainerState {
    ContainerStatus known_status{ContainerStatus::None};
    ContainerStatus desired_status{ContainerStatus::Running};
    ContainerStatus sent_status{ContainerStatus::None};
    std::optional<int> exit_code;
    HealthStatus health{HealthStatus::Unknown};
    RuntimeId runtime_id;
    std::string image_digest;
    std::string applying_error;
    std::vector<ManagedAgent> managed_agents;
};

class Container {
public:
    explicit Container(ContainerDefinition definition);

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    // ── Definition (immutable) ───────────────
    [[nodiscard]] const ContainerDefinition& definition() const noexcept { return def_; }
    [[nodiscard]] const ContainerName& name() const noexcept { return def_.name; }
    [[nodiscard]] const std::string& image() const noexcept { return def_.image; }
    [[nodiscard]] ContainerKind kind() const noexcept { return def_.kind; }
    [[nodiscard]] bool essential() const noexcept { return def_.essential; }
    [[nodiscard]] const std::vector<DependsOn>& depends_on() const noexcept { return def_.depends_on; }
    [[nodiscard]] ContainerStatus steady_state_status() const noexcept {
        return node_agent::steady_state_status(def_.kind);
    }
    [[nodiscard]] bool is_internal() const noexcept { return node_agent::is_internal(def_.kind); }

    // ── Statuses ─────────────────────────────

    [[nodiscard]] ContainerStatus known_status() const;
    /// Moves known status forward; returns false (and changes nothing) on regression.
    bool advance_known_status(ContainerStatus status);

    [[nodiscard]] ContainerStatus desired_status() const;
    /// Desired status only moves forward, so a stop request is never undone.
    bool set_desired_status(ContainerStatus status);

    [[nodiscard]] ContainerStatus sent_status() const;
    bool set_sent_status(ContainerStatus status);

    [[nodiscard]] bool is_known_steady_state() const;

    // ── Runtime data ─────────────────────────

    [[nodiscard]] std::optional<int> known_exit_code() const;
    void set_known_exit_code(int code);

    [[nodiscard]] HealthStatus health_status() const;
    void set_health_status(HealthStatus status);

    [[nodiscard]] RuntimeId runtime_id() const;
    void set_runtime_id(RuntimeId id);

    [[nodiscard]] std::string image_digest() const;
    void set_image_digest(std::string digest);
    [[nodiscard]] bool digest_resolved() const;

    [[nodiscard]] std::string applying_error() const;
    void set_applying_error(std::string reason);

    [[nodiscard]] std::vector<ManagedAgent> managed_agents() const;
    /// Returns true if the named agent moved to @p status.
    bool set_managed_agent_status(const std::string& name, ManagedAgentStatus status,
                                  std::string reason = {});
    void set_managed_agent_sent_status(const std::string& name, ManagedAgentStatus status);

    [[nodiscard]] ContainerState snapshot() const;
    void restore(const ContainerState& state);

private:
    const ContainerDefinition def_;

    mutable std::mutex mutex_;
    ContainerState state_;
};

}  // namespace node_agent
