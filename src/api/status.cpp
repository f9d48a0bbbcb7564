/**
 * @file status.cpp
 * @brief String parsing for status enumerations.
 * @author Dimitris Kafetzis
 */

#include "api/status.hpp"

#include <array>

namespace node_agent {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> parse_from(std::string_view text, const std::array<Enum, N>& values) {
    for (auto value : values) {
        if (to_string(value) == text) return value;
    }
    return std::nullopt;
}

}  // namespace

std::optional<ContainerStatus> parse_container_status(std::string_view text) noexcept {
    static constexpr std::array values{
        ContainerStatus::None, ContainerStatus::ManifestPulled, ContainerStatus::Pulled,
        ContainerStatus::Created, ContainerStatus::Running,
        ContainerStatus::ResourcesProvisioned, ContainerStatus::Stopped,
        ContainerStatus::Zombie};
    return parse_from(text, values);
}

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    static constexpr std::array values{
        TaskStatus::None, TaskStatus::ManifestPulled, TaskStatus::Pulled, TaskStatus::Created,
        TaskStatus::Running, TaskStatus::Stopped, TaskStatus::Zombie};
    return parse_from(text, values);
}

std::optional<HealthStatus> parse_health_status(std::string_view text) noexcept {
    static constexpr std::array values{
        HealthStatus::Unknown, HealthStatus::Healthy, HealthStatus::Unhealthy};
    return parse_from(text, values);
}

std::optional<ManagedAgentStatus> parse_managed_agent_status(std::string_view text) noexcept {
    static constexpr std::array values{
        ManagedAgentStatus::Pending, ManagedAgentStatus::Running, ManagedAgentStatus::Stopped};
    return parse_from(text, values);
}

std::optional<AttachmentStatus> parse_attachment_status(std::string_view text) noexcept {
    static constexpr std::array values{
        AttachmentStatus::None, AttachmentStatus::Attached, AttachmentStatus::Detached};
    return parse_from(text, values);
}

}  // namespace node_agent
