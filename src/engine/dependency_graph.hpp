/**
 * @file dependency_graph.hpp
 * @brief Container dependency resolution within one task.
 * @author Dimitris Kafetzis
 *
 * Pure functions over the current known statuses of a task's containers.
 * Nothing here blocks or polls: the task loop re-evaluates on every pass.
 *
 * Which steps are gated:
 *   - NONE → MANIFEST_PULLED is never gated; manifests resolve in parallel.
 *   - Every later step up to the steady state honors the declared
 *     dependencies and, for normal containers from CREATED on, the task's
 *     pause container reaching RESOURCES_PROVISIONED.
 *   - Stopping is never gated.
 */

#pragma once

#include "api/container.hpp"
#include "core/result.hpp"

#include <memory>
#include <string>
#include <vector>

namespace node_agent {

enum class DependencyVerdict : uint8_t {
    Resolved,      ///< Every dependency is satisfied
    Waiting,       ///< Some dependency may still become satisfied
    Unresolvable   ///< Some dependency can never be satisfied
};

[[nodiscard]] constexpr std::string_view to_string(DependencyVerdict verdict) noexcept {
    switch (verdict) {
        case DependencyVerdict::Resolved:     return "resolved";
        case DependencyVerdict::Waiting:      return "waiting";
        case DependencyVerdict::Unresolvable: return "unresolvable";
    }
    return "unknown";
}

struct DependencyCheck {
    DependencyVerdict verdict{DependencyVerdict::Resolved};
    ContainerName blocking;   ///< First dependency that is not satisfied
    std::string reason;

    [[nodiscard]] bool resolved() const noexcept { return verdict == DependencyVerdict::Resolved; }
};

using ContainerList = std::vector<std::shared_ptr<Container>>;

/**
 * @brief Decide whether @p container may take its next step toward @p target.
 *
 * @param all  Every container of the owning task (including @p container).
 */
[[nodiscard]] DependencyCheck evaluate_dependencies(const Container& container,
                                                    ContainerStatus target,
                                                    const ContainerList& all);

[[nodiscard]] bool can_transition(const Container& container, ContainerStatus target,
                                  const ContainerList& all);

/**
 * @brief Reject definitions with duplicate names, unknown or self dependencies, or cycles.
 *
 * Errors are ErrorKind::Configuration.
 */
[[nodiscard]] Result<void> validate_dependencies(const std::vector<ContainerDefinition>& containers);

}  // namespace node_agent
