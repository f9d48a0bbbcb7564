/**
 * @file task_codec.hpp
 * @brief TOML encoding of task definitions and persisted agent state.
 * @author Dimitris Kafetzis
 *
 * Two document shapes share one encoding of a task:
 *
 *   Task definition file (daemon --tasks):
 *     [[tasks]]            arn, family, version, launch_type, desired_status, ...
 *     [[tasks.containers]] name, image, kind, essential, depends_on, ports, ...
 *     [[tasks.resources]]  name, kind
 *     [[tasks.attachments]] arn, kind
 *
 *   Agent state file:
 *     schema_version, agent_version, waiting = [arn, ...]
 *     [[ledger]]           task, cpu_units, memory_mb, ports
 *     [[tasks]]            definition fields plus [tasks.state] and a
 *                          [tasks.containers.state] table per container
 *
 * Timestamps are stored as milliseconds since the Unix epoch.
 */

#pragma once

#include "api/container.hpp"
#include "api/task.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace node_agent {

inline constexpr int64_t kStateSchemaVersion = 1;

/**
 * @brief Everything needed to rebuild one task after a restart.
 */
struct TaskRecord {
    TaskDefinition definition;
    TaskState state;
    std::map<ContainerName, ContainerState> containers;
};

struct PersistedState {
    std::vector<TaskRecord> tasks;
    std::map<TaskArn, ResourceRequirements> ledger;
    std::vector<TaskArn> waiting;
};

[[nodiscard]] TaskRecord make_task_record(const Task& task);

/// Build a live task from @p record, restoring task and container state.
[[nodiscard]] std::shared_ptr<Task> restore_task(const TaskRecord& record);

// ── Agent state ──────────────────────────────

[[nodiscard]] std::string encode_state(const PersistedState& state, std::string_view agent_version);

/// Errors: Configuration for malformed documents or an unknown schema version.
[[nodiscard]] Result<PersistedState> decode_state(std::string_view text);

// ── Task definitions ─────────────────────────

[[nodiscard]] std::string encode_task_definitions(const std::vector<TaskDefinition>& definitions);
[[nodiscard]] Result<std::vector<TaskDefinition>> parse_task_definitions(std::string_view text);
[[nodiscard]] Result<std::vector<TaskDefinition>> load_task_definitions(
    const std::filesystem::path& path);

}  // namespace node_agent
