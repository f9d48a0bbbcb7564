/**
 * @file task.cpp
 * @brief Task status aggregation and synchronized accessors.
 * @author Dimitris Kafetzis
 */

#include "api/task.hpp"

#include <algorithm>

namespace node_agent {

std::optional<TaskResourceKind> parse_task_resource_kind(std::string_view text) noexcept {
    for (auto kind : {TaskResourceKind::Volume, TaskResourceKind::Secret,
                      TaskResourceKind::Credentials}) {
        if (to_string(kind) == text) return kind;
    }
    return std::nullopt;
}

std::optional<TaskResourceStatus> parse_task_resource_status(std::string_view text) noexcept {
    for (auto status : {TaskResourceStatus::None, TaskResourceStatus::Created,
                        TaskResourceStatus::Removed}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

Task::Task(TaskDefinition definition)
    : arn_(std::move(definition.arn))
    , family_(std::move(definition.family))
    , version_(std::move(definition.version))
    , launch_type_(std::move(definition.launch_type))
    , is_internal_(definition.is_internal)
    , declared_cpu_units_(definition.cpu_units)
    , declared_memory_mb_(definition.memory_mb)
{
    uint32_t cpu_sum = 0;
    uint64_t memory_sum = 0;
    for (auto& container_def : definition.containers) {
        cpu_sum += container_def.cpu_units;
        memory_sum += container_def.memory_mb;
        for (const auto& binding : container_def.port_bindings) {
            if (binding.host_port != 0 && !requirements_.uses_port(binding.host_port)) {
                requirements_.ports.push_back(binding.host_port);
            }
        }
        containers_.push_back(std::make_shared<Container>(std::move(container_def)));
    }
    requirements_.cpu_units = declared_cpu_units_ != 0 ? declared_cpu_units_ : cpu_sum;
    requirements_.memory_mb = declared_memory_mb_ != 0 ? declared_memory_mb_ : memory_sum;

    state_.desired_status = definition.desired_status;
    state_.resources = std::move(definition.resources);
    state_.attachments = std::move(definition.attachments);

    for (auto& container : containers_) {
        container->set_desired_status(to_container_status(state_.desired_status));
    }
}

std::shared_ptr<Container> Task::container_by_name(std::string_view name) const {
    for (const auto& container : containers_) {
        if (container->name() == name) return container;
    }
    return nullptr;
}

std::shared_ptr<Container> Task::pause_container() const {
    for (const auto& container : containers_) {
        if (container->kind() == ContainerKind::Pause) return container;
    }
    return nullptr;
}

// ── Statuses ─────────────────────────────────

TaskStatus Task::known_status() const {
    std::lock_guard lock(mutex_);
    return state_.known_status;
}

bool Task::advance_known_status(TaskStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.known_status) return false;
    state_.known_status = status;
    return true;
}

TaskStatus Task::desired_status() const {
    std::lock_guard lock(mutex_);
    return state_.desired_status;
}

bool Task::set_desired_status(TaskStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.desired_status) return false;
    state_.desired_status = status;
    return true;
}

TaskStatus Task::sent_status() const {
    std::lock_guard lock(mutex_);
    return state_.sent_status;
}

bool Task::set_sent_status(TaskStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.sent_status || status > state_.known_status) return false;
    state_.sent_status = status;
    return true;
}

std::string Task::stop_reason() const {
    std::lock_guard lock(mutex_);
    return state_.stop_reason;
}

void Task::set_stop_reason(std::string reason) {
    std::lock_guard lock(mutex_);
    if (state_.stop_reason.empty()) state_.stop_reason = std::move(reason);
}

// ── Aggregation ──────────────────────────────

TaskStatus Task::compute_aggregate_status() const {
    if (containers_.empty()) return TaskStatus::None;

    bool all_stopped = true;
    bool all_created = true;
    bool all_pulled = true;
    bool running = true;
    bool any_manifest = false;

    for (const auto& container : containers_) {
        const auto known = container->known_status();
        all_stopped = all_stopped && known >= ContainerStatus::Stopped;
        all_created = all_created && known >= ContainerStatus::Created;
        all_pulled = all_pulled && known >= ContainerStatus::Pulled;
        any_manifest = any_manifest || known >= ContainerStatus::ManifestPulled ||
                       container->digest_resolved();

        if (container->essential()) {
            running = running && known >= container->steady_state_status() &&
                      known < ContainerStatus::Stopped;
        } else {
            // Non-essential containers only need to have attempted to start.
            running = running && (known >= ContainerStatus::Running ||
                                  !container->applying_error().empty());
        }
    }

    if (all_stopped) return TaskStatus::Stopped;
    if (running) return TaskStatus::Running;
    if (all_created) return TaskStatus::Created;
    if (all_pulled) return TaskStatus::Pulled;
    if (any_manifest) return TaskStatus::ManifestPulled;
    return TaskStatus::None;
}

bool Task::update_known_from_containers() {
    return advance_known_status(compute_aggregate_status());
}

bool Task::propagate_essential_stop() {
    bool essential_stopped = false;
    for (const auto& container : containers_) {
        if (container->essential() && container->known_status() >= ContainerStatus::Stopped) {
            essential_stopped = true;
            break;
        }
    }
    if (!essential_stopped) return false;

    mark_execution_stopped(std::chrono::system_clock::now());
    bool changed = set_desired_status(TaskStatus::Stopped);
    changed = propagate_desired_stop() || changed;
    return changed;
}

bool Task::propagate_desired_stop() {
    if (desired_status() < TaskStatus::Stopped) return false;
    bool changed = false;
    for (const auto& container : containers_) {
        changed = container->set_desired_status(ContainerStatus::Stopped) || changed;
    }
    return changed;
}

bool Task::has_container_with_resolved_digest() const {
    return std::any_of(containers_.begin(), containers_.end(),
                       [](const auto& container) { return container->digest_resolved(); });
}

// ── Resources and attachments ────────────────

std::vector<TaskResource> Task::resources() const {
    std::lock_guard lock(mutex_);
    return state_.resources;
}

void Task::set_resource_status(const std::string& name, TaskResourceStatus status) {
    std::lock_guard lock(mutex_);
    for (auto& resource : state_.resources) {
        if (resource.name == name) resource.status = status;
    }
}

bool Task::resources_created() const {
    std::lock_guard lock(mutex_);
    return std::all_of(state_.resources.begin(), state_.resources.end(), [](const auto& r) {
        return r.status == TaskResourceStatus::Created;
    });
}

std::vector<Attachment> Task::attachments() const {
    std::lock_guard lock(mutex_);
    return state_.attachments;
}

void Task::set_attachment_status(const std::string& arn, AttachmentStatus status) {
    std::lock_guard lock(mutex_);
    for (auto& attachment : state_.attachments) {
        if (attachment.arn == arn && status > attachment.status) attachment.status = status;
    }
}

void Task::set_attachment_sent_status(const std::string& arn, AttachmentStatus status) {
    std::lock_guard lock(mutex_);
    for (auto& attachment : state_.attachments) {
        if (attachment.arn == arn && status > attachment.sent_status) {
            attachment.sent_status = status;
        }
    }
}

// ── Timestamps ───────────────────────────────

std::optional<Timestamp> Task::pull_started_at() const {
    std::lock_guard lock(mutex_);
    return state_.pull_started_at;
}

std::optional<Timestamp> Task::pull_stopped_at() const {
    std::lock_guard lock(mutex_);
    return state_.pull_stopped_at;
}

std::optional<Timestamp> Task::execution_stopped_at() const {
    std::lock_guard lock(mutex_);
    return state_.execution_stopped_at;
}

void Task::mark_pull_started(Timestamp at) {
    std::lock_guard lock(mutex_);
    if (!state_.pull_started_at) state_.pull_started_at = at;
}

void Task::mark_pull_stopped(Timestamp at) {
    std::lock_guard lock(mutex_);
    if (!state_.pull_stopped_at) state_.pull_stopped_at = at;
}

void Task::mark_execution_stopped(Timestamp at) {
    std::lock_guard lock(mutex_);
    if (!state_.execution_stopped_at) state_.execution_stopped_at = at;
}

TaskState Task::snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void Task::restore(const TaskState& state) {
    std::lock_guard lock(mutex_);
    state_ = state;
}

TaskDefinition Task::definition() const {
    TaskDefinition def{
        .arn = arn_,
        .family = family_,
        .version = version_,
        .launch_type = launch_type_,
        .desired_status = desired_status(),
        .is_internal = is_internal_,
        .cpu_units = declared_cpu_units_,
        .memory_mb = declared_memory_mb_,
    };
    for (const auto& container : containers_) {
        def.containers.push_back(container->definition());
    }
    def.resources = resources();
    def.attachments = attachments();
    return def;
}

}  // namespace node_agent
