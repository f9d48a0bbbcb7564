/**
 * @file dependency_graph.cpp
 * @brief Dependency condition checks and DFS-based cycle detection.
 * @author Dimitris Kafetzis
 */

#include "engine/dependency_graph.hpp"

#include <stack>
#include <unordered_map>

namespace node_agent {

namespace {

const Container* find_container(const ContainerList& all, const ContainerName& name) {
    for (const auto& container : all) {
        if (container->name() == name) return container.get();
    }
    return nullptr;
}

DependencyCheck waiting(const ContainerName& name, std::string reason) {
    return {DependencyVerdict::Waiting, name, std::move(reason)};
}

DependencyCheck unresolvable(const ContainerName& name, std::string reason) {
    return {DependencyVerdict::Unresolvable, name, std::move(reason)};
}

/// Check one declared dependency against its current state.
DependencyCheck check_condition(const Container& dependent, const DependsOn& dep,
                                const Container& dependency, ContainerStatus target) {
    const auto state = dependency.snapshot();
    const auto known = state.known_status;
    const auto& name = dependency.name();
    const std::string prefix = dependent.name() + " depends on " + name + " (" +
                               std::string(to_string(dep.condition)) + ")";

    switch (dep.condition) {
        case DependencyCondition::Start:
            if (target <= ContainerStatus::Created) {
                if (known >= ContainerStatus::Created) return {};
                return waiting(name, prefix + ": dependency not created yet");
            }
            if (known == ContainerStatus::Stopped) {
                // An exit code means the dependency did run before it stopped.
                if (state.exit_code) return {};
                return unresolvable(name, prefix + ": dependency stopped without starting");
            }
            if (known >= dependency.steady_state_status()) return {};
            return waiting(name, prefix + ": dependency not started yet");

        case DependencyCondition::Complete:
            if (known >= ContainerStatus::Stopped) return {};
            return waiting(name, prefix + ": dependency has not completed");

        case DependencyCondition::Success:
            if (known < ContainerStatus::Stopped) {
                return waiting(name, prefix + ": dependency has not completed");
            }
            if (state.exit_code && *state.exit_code == 0) return {};
            return unresolvable(name, prefix + ": dependency exited with code " +
                                          (state.exit_code ? std::to_string(*state.exit_code)
                                                           : std::string("unknown")));

        case DependencyCondition::Healthy:
            if (state.health == HealthStatus::Healthy) return {};
            if (known >= ContainerStatus::Stopped) {
                return unresolvable(name, prefix + ": dependency stopped before becoming healthy");
            }
            return waiting(name, prefix + ": dependency not healthy yet");
    }
    return {};
}

}  // namespace

// ─────────────────────────────────────────────
// Evaluation
// ─────────────────────────────────────────────

DependencyCheck evaluate_dependencies(const Container& container, ContainerStatus target,
                                      const ContainerList& all) {
    if (target <= ContainerStatus::ManifestPulled || target >= ContainerStatus::Stopped) {
        return {};
    }

    // Normal containers join the network namespace held by the pause container.
    if (container.kind() == ContainerKind::Normal && target >= ContainerStatus::Created) {
        for (const auto& other : all) {
            if (other->kind() != ContainerKind::Pause) continue;
            const auto pause_known = other->known_status();
            if (pause_known == ContainerStatus::ResourcesProvisioned) break;
            if (pause_known >= ContainerStatus::Stopped) {
                return unresolvable(other->name(),
                                    "pause container " + other->name() +
                                        " stopped before task network was provisioned");
            }
            return waiting(other->name(), "waiting for task network on " + other->name());
        }
    }

    DependencyCheck first_wait;
    for (const auto& dep : container.depends_on()) {
        const Container* dependency = find_container(all, dep.container_name);
        if (dependency == nullptr) {
            return unresolvable(dep.container_name, container.name() +
                                                        " depends on unknown container " +
                                                        dep.container_name);
        }
        auto check = check_condition(container, dep, *dependency, target);
        if (check.verdict == DependencyVerdict::Unresolvable) return check;
        if (check.verdict == DependencyVerdict::Waiting && first_wait.resolved()) {
            first_wait = std::move(check);
        }
    }
    return first_wait;
}

bool can_transition(const Container& container, ContainerStatus target, const ContainerList& all) {
    return evaluate_dependencies(container, target, all).resolved();
}

// ─────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────

Result<void> validate_dependencies(const std::vector<ContainerDefinition>& containers) {
    std::unordered_map<ContainerName, const ContainerDefinition*> by_name;
    for (const auto& def : containers) {
        if (!by_name.emplace(def.name, &def).second) {
            return Error{ErrorKind::Configuration, "duplicate container name: " + def.name};
        }
    }

    for (const auto& def : containers) {
        for (const auto& dep : def.depends_on) {
            if (dep.container_name == def.name) {
                return Error{ErrorKind::Configuration,
                             "container " + def.name + " depends on itself"};
            }
            if (!by_name.contains(dep.container_name)) {
                return Error{ErrorKind::Configuration,
                             "container " + def.name + " depends on unknown container " +
                                 dep.container_name};
            }
        }
    }

    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<ContainerName, Color> color;
    for (const auto& def : containers) {
        color[def.name] = Color::White;
    }

    for (const auto& start : containers) {
        if (color[start.name] != Color::White) continue;

        struct Frame {
            const ContainerDefinition* node;
            size_t dep_idx;
        };

        std::stack<Frame> dfs_stack;
        dfs_stack.push({&start, 0});
        color[start.name] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();

            if (idx >= node->depends_on.size()) {
                color[node->name] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            const auto& next = node->depends_on[idx].container_name;
            ++idx;

            if (color[next] == Color::Gray) {
                return Error{ErrorKind::Configuration,
                             "dependency cycle through containers " + node->name + " and " + next};
            }
            if (color[next] == Color::White) {
                color[next] = Color::Gray;
                dfs_stack.push({by_name.at(next), 0});
            }
        }
    }

    return {};
}

}  // namespace node_agent
