/**
 * @file managed_task.cpp
 * @brief ManagedTask control loop.
 * @author Dimitris Kafetzis
 */

#include "engine/managed_task.hpp"

#include "engine/dependency_graph.hpp"

#include <algorithm>

namespace node_agent {

namespace {

using Clock = std::chrono::steady_clock;

/// Exponential backoff: base, 2*base, 4*base ... capped at 32*base.
Duration backoff_for(Duration base, uint32_t attempts) {
    const uint32_t shift = std::min<uint32_t>(attempts > 0 ? attempts - 1 : 0, 5);
    return base * (1 << shift);
}

}  // namespace

ManagedTaskSettings ManagedTaskSettings::from_config(const EngineConfig& config) {
    return ManagedTaskSettings{
        .steady_state_poll_interval = Duration{config.steady_state_poll_interval_ms},
        .task_cleanup_wait = Duration{static_cast<Duration::rep>(config.task_cleanup_wait_ms)},
        .max_transition_attempts = std::max<uint32_t>(config.max_transition_attempts, 1),
        .retry_backoff = Duration{config.retry_backoff_ms},
        .resource_timeout = Duration{config.create_timeout_ms},
    };
}

ManagedTask::ManagedTask(std::shared_ptr<Task> task, ContainerTransitioner& transitioner,
                         IResourceProvisioner& provisioner, CallExecutor& executor,
                         ManagedTaskSettings settings, ManagedTaskHooks hooks, Logger& logger)
    : task_(std::move(task))
    , transitioner_(transitioner)
    , provisioner_(provisioner)
    , executor_(executor)
    , settings_(settings)
    , hooks_(std::move(hooks))
    , logger_(logger) {}

ManagedTask::~ManagedTask() {
    stop_and_join();
}

void ManagedTask::start() {
    thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void ManagedTask::update_desired_status(TaskStatus desired) {
    inbox_.send(desired);
}

void ManagedTask::stop_and_join() {
    thread_.request_stop();
    inbox_.close();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

// ─────────────────────────────────────────────
// Control loop
// ─────────────────────────────────────────────

void ManagedTask::run(std::stop_token stop) {
    logger_.info("Managing task", {
        {"task", task_->arn()},
        {"known", std::string(to_string(task_->known_status()))},
        {"desired", std::string(to_string(task_->desired_status()))},
    });
    task_->propagate_desired_stop();

    auto next_poll = Clock::now();
    while (!stop.stop_requested()) {
        while (auto desired = inbox_.try_receive()) {
            apply_desired(*desired);
        }

        const auto now = Clock::now();
        const bool poll_due = now >= next_poll;
        if (poll_due) next_poll = now + settings_.steady_state_poll_interval;

        const bool changed = pass(stop, poll_due);
        if (cancelled_) break;

        emit_events();
        if (changed && hooks_.on_change) hooks_.on_change();

        if (stopped_event_sent()) break;
        if (changed) continue;

        if (auto desired = inbox_.receive_until(next_wakeup(next_poll), stop)) {
            apply_desired(*desired);
        }
    }

    if (stop.stop_requested() || cancelled_) {
        logger_.debug("Task loop cancelled", {{"task", task_->arn()}});
        return;
    }
    cleanup(stop);
}

void ManagedTask::apply_desired(TaskStatus desired) {
    if (!task_->set_desired_status(desired)) return;
    logger_.info("Task desired status updated", {
        {"task", task_->arn()},
        {"desired", std::string(to_string(desired))},
    });
    task_->propagate_desired_stop();
}

bool ManagedTask::pass(std::stop_token stop, bool poll_due) {
    bool changed = provision_resources(stop);
    if (cancelled_) return changed;

    changed = mark_attachments() || changed;

    for (const auto& container : task_->containers()) {
        changed = progress_container(*container, stop) || changed;
        if (cancelled_) return changed;
    }

    if (poll_due) {
        changed = poll_steady_state(stop) || changed;
        if (cancelled_) return changed;
    }

    changed = propagate_essential_exit() || changed;
    update_pull_stopped();
    changed = task_->update_known_from_containers() || changed;
    return changed;
}

SteadyTime ManagedTask::next_wakeup(SteadyTime next_poll) const {
    // A retry already due was either attempted this pass or is blocked on
    // something the poll timer will notice; waking for it would spin.
    const auto now = Clock::now();
    SteadyTime wakeup = next_poll;
    for (const auto& [key, retry] : retries_) {
        if (retry.attempts > 0 && retry.not_before > now) wakeup = std::min(wakeup, retry.not_before);
    }
    return wakeup;
}

bool ManagedTask::stopped_event_sent() const {
    return task_->sent_status() >= TaskStatus::Stopped;
}

// ─────────────────────────────────────────────
// Resources and attachments
// ─────────────────────────────────────────────

bool ManagedTask::provision_resources(std::stop_token stop) {
    if (task_->desired_status() >= TaskStatus::Stopped) return false;

    bool changed = false;
    for (const auto& resource : task_->resources()) {
        if (resource.status != TaskResourceStatus::None) continue;

        const std::string key = "resource:" + resource.name;
        auto& retry = retries_[key];
        if (Clock::now() < retry.not_before) continue;

        auto created = executor_.run_bounded(
            [&provisioner = provisioner_, arn = task_->arn(), resource](std::stop_token call_stop) {
                return provisioner.create_resource(arn, resource, call_stop);
            },
            settings_.resource_timeout, stop, "resource " + resource.name);

        if (created) {
            task_->set_resource_status(resource.name, TaskResourceStatus::Created);
            retries_.erase(key);
            changed = true;
            continue;
        }

        const auto& error = created.error();
        if (error.kind == ErrorKind::Cancelled) {
            cancelled_ = true;
            return changed;
        }
        if (error.retryable() && ++retry.attempts < settings_.max_transition_attempts) {
            retry.not_before = Clock::now() + backoff_for(settings_.retry_backoff, retry.attempts);
            logger_.info("Retrying task resource", {
                {"task", task_->arn()},
                {"resource", resource.name},
                {"attempt", std::to_string(retry.attempts + 1)},
                {"error", error.message},
            });
            continue;
        }

        logger_.error("Task resource could not be created", {
            {"task", task_->arn()},
            {"resource", resource.name},
            {"error", error.message},
        });
        retries_.erase(key);
        task_->set_stop_reason("failed to create resource " + resource.name + ": " + error.message);
        task_->set_desired_status(TaskStatus::Stopped);
        task_->propagate_desired_stop();
        return true;
    }
    return changed;
}

bool ManagedTask::mark_attachments() {
    auto pause = task_->pause_container();
    const bool network_ready = pause
        ? pause->known_status() == ContainerStatus::ResourcesProvisioned
        : task_->resources_created() && task_->desired_status() < TaskStatus::Stopped;
    if (!network_ready) return false;

    bool changed = false;
    for (const auto& attachment : task_->attachments()) {
        if (attachment.status != AttachmentStatus::None) continue;
        task_->set_attachment_status(attachment.arn, AttachmentStatus::Attached);
        changed = true;
    }
    return changed;
}

// ─────────────────────────────────────────────
// Container progression
// ─────────────────────────────────────────────

bool ManagedTask::progress_container(Container& container, std::stop_token stop) {
    const auto known = container.known_status();
    auto target = container.desired_status();
    if (target == ContainerStatus::Running) target = container.steady_state_status();

    const auto step = next_status(known, target, container.kind());
    if (step == known) {
        retries_.erase(container.name());
        return false;
    }

    if (step < ContainerStatus::Stopped) {
        if (step >= ContainerStatus::Created && !task_->resources_created()) return false;

        auto check = evaluate_dependencies(container, step, task_->containers());
        if (check.verdict == DependencyVerdict::Waiting) {
            retries_.erase(container.name());
            return false;
        }
        if (check.verdict == DependencyVerdict::Unresolvable) {
            logger_.warn("Container dependency can never be satisfied", {
                {"task", task_->arn()},
                {"container", container.name()},
                {"reason", check.reason},
            });
            container.set_applying_error(check.reason);
            container.set_desired_status(ContainerStatus::Stopped);
            return true;
        }
    }

    auto& retry = retries_[container.name()];
    if (retry.step != step) retry = RetryState{.step = step};
    if (Clock::now() < retry.not_before) return false;

    auto result = transitioner_.progress(*task_, container, target, stop);
    if (result.ok()) {
        retries_.erase(container.name());
        after_step(container, result.status);
        return true;
    }

    const auto& error = *result.error;
    if (error.kind == ErrorKind::Cancelled) {
        cancelled_ = true;
        return false;
    }
    if (result.retryable && ++retry.attempts < settings_.max_transition_attempts) {
        retry.not_before = Clock::now() + backoff_for(settings_.retry_backoff, retry.attempts);
        logger_.info("Retrying container transition", {
            {"task", task_->arn()},
            {"container", container.name()},
            {"to", std::string(to_string(step))},
            {"attempt", std::to_string(retry.attempts + 1)},
        });
        return false;
    }

    retries_.erase(container.name());
    fail_container(container, step, error);
    return true;
}

void ManagedTask::fail_container(Container& container, ContainerStatus step, const Error& error) {
    logger_.error("Container transition failed permanently", {
        {"task", task_->arn()},
        {"container", container.name()},
        {"to", std::string(to_string(step))},
        {"error", error.message},
    });
    container.set_applying_error(error.message);
    container.set_desired_status(ContainerStatus::Stopped);

    // A container that never started, or that the runtime cannot stop, has
    // nothing left to wait for.
    if (step == ContainerStatus::Stopped || container.known_status() < ContainerStatus::Running) {
        container.advance_known_status(ContainerStatus::Stopped);
        after_step(container, ContainerStatus::Stopped);
    }
}

void ManagedTask::after_step(Container& container, ContainerStatus status) {
    if (status == container.steady_state_status()) {
        for (const auto& agent : container.managed_agents()) {
            container.set_managed_agent_status(agent.name, ManagedAgentStatus::Running);
        }
    }
    if (status == ContainerStatus::Stopped) {
        for (const auto& agent : container.managed_agents()) {
            container.set_managed_agent_status(agent.name, ManagedAgentStatus::Stopped,
                                               container.applying_error());
        }
    }
}

bool ManagedTask::poll_steady_state(std::stop_token stop) {
    bool changed = false;
    for (const auto& container : task_->containers()) {
        const auto known = container->known_status();
        if (known < ContainerStatus::Running || known >= ContainerStatus::Stopped) continue;

        auto inspection = transitioner_.inspect(*container, stop);
        if (!inspection) {
            const auto& error = inspection.error();
            if (error.kind == ErrorKind::Cancelled) {
                cancelled_ = true;
                return changed;
            }
            if (error.kind == ErrorKind::NotFound) {
                logger_.warn("Container disappeared from the runtime", {
                    {"task", task_->arn()},
                    {"container", container->name()},
                });
                container->set_applying_error("container no longer exists in the runtime");
                container->set_desired_status(ContainerStatus::Stopped);
                container->advance_known_status(ContainerStatus::Stopped);
                after_step(*container, ContainerStatus::Stopped);
                changed = true;
                continue;
            }
            logger_.warn("Container inspection failed", {
                {"task", task_->arn()},
                {"container", container->name()},
                {"error", error.message},
            });
            continue;
        }

        if (inspection->health != container->health_status()) {
            container->set_health_status(inspection->health);
            changed = true;
        }
        if (inspection->status == ContainerStatus::Stopped) {
            if (inspection->exit_code) container->set_known_exit_code(*inspection->exit_code);
            container->set_desired_status(ContainerStatus::Stopped);
            container->advance_known_status(ContainerStatus::Stopped);
            after_step(*container, ContainerStatus::Stopped);
            logger_.info("Container exited", {
                {"task", task_->arn()},
                {"container", container->name()},
                {"exit_code", inspection->exit_code ? std::to_string(*inspection->exit_code) : "unknown"},
            });
            changed = true;
        }
    }
    return changed;
}

bool ManagedTask::propagate_essential_exit() {
    if (!task_->propagate_essential_stop()) return false;
    task_->set_stop_reason("Essential container in task exited");
    logger_.info("Essential container stopped; stopping task", {{"task", task_->arn()}});
    return true;
}

void ManagedTask::update_pull_stopped() {
    if (!task_->pull_started_at() || task_->pull_stopped_at()) return;
    const auto& containers = task_->containers();
    const bool all_pulled = std::all_of(containers.begin(), containers.end(), [](const auto& c) {
        return c->known_status() >= ContainerStatus::Pulled;
    });
    if (all_pulled) task_->mark_pull_stopped(std::chrono::system_clock::now());
}

// ─────────────────────────────────────────────
// Event hand-off
// ─────────────────────────────────────────────

bool ManagedTask::emit(StateChangeEvent event) {
    logger_.debug("State change", event_fields(event));
    return hooks_.emit ? hooks_.emit(std::move(event)) : true;
}

void ManagedTask::emit_events() {
    for (const auto& container : task_->containers()) {
        const auto known = container->known_status();
        const auto& name = container->name();

        if (container->sent_status() < known) {
            auto last = last_evaluated_.find(name);
            if (last == last_evaluated_.end() || last->second != known) {
                last_evaluated_[name] = known;
                auto event = make_container_state_change(*task_, *container, {});
                if (event) {
                    if (emit(std::move(*event))) {
                        container->set_sent_status(known);
                    } else {
                        last_evaluated_.erase(name);
                    }
                } else if (event.error().kind == ErrorKind::ShouldNotSend) {
                    logger_.debug("Container event not sent", {
                        {"task", task_->arn()}, {"container", name}, {"reason", event.error().message}});
                } else {
                    logger_.warn("Container event could not be built", {
                        {"task", task_->arn()}, {"container", name}, {"error", event.error().message}});
                }
            }
        }

        for (const auto& agent : container->managed_agents()) {
            if (agent.status <= agent.sent_status) continue;
            auto event = make_managed_agent_state_change(*task_, *container, agent.name);
            if (!event) continue;
            if (emit(std::move(*event))) {
                container->set_managed_agent_sent_status(agent.name, agent.status);
            }
        }
    }

    for (const auto& attachment : task_->attachments()) {
        if (attachment.status <= attachment.sent_status) continue;
        auto event = make_attachment_state_change(*task_, attachment);
        if (event) {
            if (emit(std::move(*event))) {
                task_->set_attachment_sent_status(attachment.arn, attachment.status);
            }
        } else if (event.error().kind == ErrorKind::ShouldNotSend) {
            task_->set_attachment_sent_status(attachment.arn, attachment.status);
        }
    }

    const auto known = task_->known_status();
    if (task_->sent_status() >= known || known == last_evaluated_task_) return;
    last_evaluated_task_ = known;

    auto event = make_task_state_change(*task_, {});
    if (event) {
        if (!emit(std::move(*event))) {
            last_evaluated_task_ = TaskStatus::None;
            return;
        }
    } else if (event.error().kind == ErrorKind::ShouldNotSend && known == TaskStatus::Stopped) {
        // Internal tasks never report, but their stop still completes the lifecycle.
        logger_.debug("Task event not sent", {{"task", task_->arn()}, {"reason", event.error().message}});
    } else {
        logger_.debug("Task event not sent", {{"task", task_->arn()}, {"reason", event.error().message}});
        return;
    }

    task_->set_sent_status(known);
    if (known == TaskStatus::Stopped && hooks_.on_stopped) {
        hooks_.on_stopped(task_->arn());
    }
}

// ─────────────────────────────────────────────
// Cleanup
// ─────────────────────────────────────────────

void ManagedTask::cleanup(std::stop_token stop) {
    logger_.info("Task stopped; cleanup scheduled", {
        {"task", task_->arn()},
        {"wait_ms", std::to_string(settings_.task_cleanup_wait.count())},
    });

    const auto deadline = Clock::now() + settings_.task_cleanup_wait;
    while (!stop.stop_requested() && Clock::now() < deadline) {
        // Desired-status updates after STOPPED have nothing left to change.
        if (!inbox_.receive_until(deadline, stop) && inbox_.closed()) break;
    }
    if (stop.stop_requested()) return;

    for (const auto& container : task_->containers()) {
        auto result = transitioner_.progress(*task_, *container, ContainerStatus::Zombie, stop);
        if (result.ok()) continue;
        if (result.error->kind == ErrorKind::Cancelled) return;
        logger_.warn("Could not remove container", {
            {"task", task_->arn()},
            {"container", container->name()},
            {"error", result.error->message},
        });
    }

    for (const auto& resource : task_->resources()) {
        if (resource.status != TaskResourceStatus::Created) continue;
        auto removed = executor_.run_bounded(
            [&provisioner = provisioner_, arn = task_->arn(), resource](std::stop_token call_stop) {
                return provisioner.cleanup_resource(arn, resource, call_stop);
            },
            settings_.resource_timeout, stop, "resource cleanup " + resource.name);
        if (removed) {
            task_->set_resource_status(resource.name, TaskResourceStatus::Removed);
            continue;
        }
        if (removed.error().kind == ErrorKind::Cancelled) return;
        logger_.warn("Could not clean up task resource", {
            {"task", task_->arn()},
            {"resource", resource.name},
            {"error", removed.error().message},
        });
    }

    task_->advance_known_status(TaskStatus::Zombie);
    logger_.info("Task cleaned up", {{"task", task_->arn()}});
    finished_ = true;
    if (hooks_.on_cleaned) hooks_.on_cleaned(task_->arn());
}

}  // namespace node_agent
