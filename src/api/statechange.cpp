/**
 * @file statechange.cpp
 * @brief Event eligibility checks and formatting.
 * @author Dimitris Kafetzis
 */

#include "api/statechange.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace node_agent {

std::string format_timestamp(Timestamp at) {
    auto time_t_at = std::chrono::system_clock::to_time_t(at);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        at.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&time_t_at, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%T") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << 'Z';
    return oss.str();
}

// ─────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────

Fields ContainerStateChange::to_fields() const {
    Fields fields{
        {"event", "ContainerStateChange"},
        {"task", task_arn},
        {"container", container_name},
        {"status", std::string(node_agent::to_string(status))},
    };
    if (exit_code) fields.emplace_back("exit_code", std::to_string(*exit_code));
    if (!reason.empty()) fields.emplace_back("reason", reason);
    if (!image_digest.empty()) fields.emplace_back("image_digest", image_digest);
    return fields;
}

std::string ContainerStateChange::to_string() const {
    std::ostringstream oss;
    oss << task_arn << ' ' << container_name << " -> " << node_agent::to_string(status);
    if (exit_code) oss << " exit_code=" << *exit_code;
    if (!reason.empty()) oss << " reason=" << reason;
    for (const auto& binding : port_bindings) {
        oss << " port=" << binding.host_port << ':' << binding.container_port << '/'
            << binding.protocol;
    }
    return oss.str();
}

Fields TaskStateChange::to_fields() const {
    Fields fields{
        {"event", "TaskStateChange"},
        {"task", task_arn},
        {"status", std::string(node_agent::to_string(status))},
    };
    if (!reason.empty()) fields.emplace_back("reason", reason);
    if (pull_started_at) fields.emplace_back("pull_started_at", format_timestamp(*pull_started_at));
    if (pull_stopped_at) fields.emplace_back("pull_stopped_at", format_timestamp(*pull_stopped_at));
    if (execution_stopped_at) {
        fields.emplace_back("execution_stopped_at", format_timestamp(*execution_stopped_at));
    }
    return fields;
}

std::string TaskStateChange::to_string() const {
    std::string out = task_arn + " -> " + std::string(node_agent::to_string(status));
    if (!reason.empty()) out += " reason=" + reason;
    return out;
}

Fields ManagedAgentStateChange::to_fields() const {
    return {
        {"event", "ManagedAgentStateChange"},
        {"task", task_arn},
        {"container", container_name},
        {"agent", name},
        {"status", std::string(node_agent::to_string(status))},
    };
}

std::string ManagedAgentStateChange::to_string() const {
    return task_arn + ' ' + container_name + '/' + name + " -> " +
           std::string(node_agent::to_string(status));
}

Fields AttachmentStateChange::to_fields() const {
    return {
        {"event", "AttachmentStateChange"},
        {"task", task_arn},
        {"attachment", attachment_arn},
        {"status", std::string(node_agent::to_string(status))},
    };
}

std::string AttachmentStateChange::to_string() const {
    return attachment_arn + " -> " + std::string(node_agent::to_string(status));
}

// ─────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────

Result<TaskStateChange> make_task_state_change(const Task& task, std::string reason) {
    if (task.is_internal()) {
        return make_error<TaskStateChange>(
            ErrorKind::ShouldNotSend,
            "should not send events for internal tasks or containers: " + task.arn());
    }

    const auto known = task.known_status();
    if (known != TaskStatus::ManifestPulled && !backend_recognized(known)) {
        return Error("task state change: status not recognized by backend: " +
                     std::string(to_string(known)));
    }
    if (task.sent_status() >= known) {
        return Error("task state change: status [" + std::string(to_string(known)) +
                     "] already sent");
    }
    if (known == TaskStatus::ManifestPulled && !task.has_container_with_resolved_digest()) {
        return make_error<TaskStateChange>(
            ErrorKind::ShouldNotSend,
            "task state change: status MANIFEST_PULLED not eligible for backend reporting "
            "as no digests were resolved");
    }

    if (reason.empty() && known == TaskStatus::Stopped) reason = task.stop_reason();

    return TaskStateChange{
        .task_arn = task.arn(),
        .status = known,
        .reason = std::move(reason),
        .pull_started_at = task.pull_started_at(),
        .pull_stopped_at = task.pull_stopped_at(),
        .execution_stopped_at = task.execution_stopped_at(),
    };
}

Result<ContainerStateChange> make_container_state_change(const Task& task,
                                                         const Container& container,
                                                         std::string reason) {
    if (task.is_internal() || container.is_internal()) {
        return make_error<ContainerStateChange>(
            ErrorKind::ShouldNotSend,
            "should not send events for internal tasks or containers: " + container.name());
    }

    const auto state = container.snapshot();
    const auto steady = container.steady_state_status();
    const auto known = state.known_status;

    if (known != ContainerStatus::ManifestPulled && !should_report_to_backend(known, steady)) {
        return make_error<ContainerStateChange>(
            ErrorKind::ShouldNotSend,
            "container state change: status not recognized by backend: " +
                std::string(to_string(known)));
    }
    if (known == ContainerStatus::ManifestPulled && state.image_digest.empty()) {
        return make_error<ContainerStateChange>(
            ErrorKind::ShouldNotSend,
            "container state change: no need to send MANIFEST_PULLED event as no resolved "
            "digests were found");
    }
    if (state.sent_status >= known) {
        return make_error<ContainerStateChange>(
            ErrorKind::ShouldNotSend,
            "container state change: status [" + std::string(to_string(known)) +
                "] already sent for container " + container.name() + ", task " + task.arn());
    }

    if (reason.empty()) reason = state.applying_error;

    return ContainerStateChange{
        .task_arn = task.arn(),
        .container_name = container.name(),
        .runtime_id = state.runtime_id,
        .status = reported_container_status(known, steady),
        .image_digest = state.image_digest,
        .reason = std::move(reason),
        .exit_code = state.exit_code,
        .port_bindings = container.definition().port_bindings,
    };
}

Result<ManagedAgentStateChange> make_managed_agent_state_change(const Task& task,
                                                                const Container& container,
                                                                const std::string& agent_name) {
    for (const auto& agent : container.managed_agents()) {
        if (agent.name != agent_name) continue;
        if (!should_report_to_backend(agent.status)) {
            return Error("managed agent state change: status not recognized by backend: " +
                         std::string(to_string(agent.status)));
        }
        if (agent.sent_status >= agent.status) {
            return Error("managed agent state change: status [" +
                         std::string(to_string(agent.status)) + "] already sent");
        }
        return ManagedAgentStateChange{
            .task_arn = task.arn(),
            .container_name = container.name(),
            .name = agent.name,
            .status = agent.status,
            .reason = agent.reason,
        };
    }
    return make_error<ManagedAgentStateChange>(
        ErrorKind::NotFound,
        "no managed agent " + agent_name + " in container " + container.name());
}

Result<AttachmentStateChange> make_attachment_state_change(const Task& task,
                                                           const Attachment& attachment) {
    if (task.is_internal()) {
        return make_error<AttachmentStateChange>(
            ErrorKind::ShouldNotSend,
            "should not send events for internal tasks or containers: " + task.arn());
    }
    if (attachment.status != AttachmentStatus::Attached) {
        return Error("attachment state change: status not recognized by backend: " +
                     std::string(to_string(attachment.status)));
    }
    if (attachment.sent_status >= attachment.status) {
        return Error("attachment state change: status [" +
                     std::string(to_string(attachment.status)) + "] already sent");
    }
    return AttachmentStateChange{
        .task_arn = task.arn(),
        .attachment_arn = attachment.arn,
        .status = attachment.status,
    };
}

// ─────────────────────────────────────────────
// Event helpers
// ─────────────────────────────────────────────

const TaskArn& event_task_arn(const StateChangeEvent& event) {
    return std::visit([](const auto& e) -> const TaskArn& { return e.task_arn; }, event);
}

Fields event_fields(const StateChangeEvent& event) {
    return std::visit([](const auto& e) { return e.to_fields(); }, event);
}

std::string event_to_string(const StateChangeEvent& event) {
    return std::visit([](const auto& e) { return e.to_string(); }, event);
}

}  // namespace node_agent
