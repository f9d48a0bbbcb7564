/**
 * @file container_transition.cpp
 * @brief ContainerTransitioner implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/container_transition.hpp"

namespace node_agent {

TransitionTimeouts TransitionTimeouts::from_config(const EngineConfig& config) {
    return TransitionTimeouts{
        .manifest_pull = Duration{config.manifest_pull_timeout_ms},
        .image_pull = Duration{config.image_pull_timeout_ms},
        .create = Duration{config.create_timeout_ms},
        .start = Duration{config.start_timeout_ms},
        .inspect = Duration{config.inspect_timeout_ms},
        .stop_grace = Duration{config.container_stop_timeout_ms},
        .stop_slack = Duration{config.stop_call_slack_ms},
    };
}

ContainerStatus next_status(ContainerStatus known, ContainerStatus target,
                            ContainerKind kind) noexcept {
    if (target <= known) return known;
    if (known == ContainerStatus::Stopped) {
        return target == ContainerStatus::Zombie ? ContainerStatus::Zombie : known;
    }
    if (target >= ContainerStatus::Stopped) return ContainerStatus::Stopped;

    switch (known) {
        case ContainerStatus::None:           return ContainerStatus::ManifestPulled;
        case ContainerStatus::ManifestPulled: return ContainerStatus::Pulled;
        case ContainerStatus::Pulled:         return ContainerStatus::Created;
        case ContainerStatus::Created:        return ContainerStatus::Running;
        case ContainerStatus::Running:
            return kind == ContainerKind::Pause ? ContainerStatus::ResourcesProvisioned : known;
        case ContainerStatus::ResourcesProvisioned:
        case ContainerStatus::Stopped:
        case ContainerStatus::Zombie:
            return known;
    }
    return known;
}

ContainerTransitioner::ContainerTransitioner(IRuntimeDriver& driver,
                                             IResourceProvisioner& provisioner,
                                             CallExecutor& executor, TransitionTimeouts timeouts,
                                             Logger& logger)
    : driver_(driver)
    , provisioner_(provisioner)
    , executor_(executor)
    , timeouts_(timeouts)
    , logger_(logger) {}

TransitionResult ContainerTransitioner::progress(Task& task, Container& container,
                                                 ContainerStatus target, std::stop_token stop) {
    const auto known = container.known_status();
    const auto next = next_status(known, target, container.kind());
    if (next == known) {
        return TransitionResult{.status = known};
    }

    logger_.debug("Container transition", {
        {"task", task.arn()},
        {"container", container.name()},
        {"from", std::string(to_string(known))},
        {"to", std::string(to_string(next))},
    });

    std::optional<int> exit_code;
    Result<void> outcome;
    switch (next) {
        case ContainerStatus::ManifestPulled:       outcome = pull_manifest(task, container, stop); break;
        case ContainerStatus::Pulled:               outcome = pull_image(task, container, stop); break;
        case ContainerStatus::Created:              outcome = create(task, container, stop); break;
        case ContainerStatus::Running:              outcome = start(container, stop); break;
        case ContainerStatus::ResourcesProvisioned: outcome = provision_network(task, container, stop); break;
        case ContainerStatus::Stopped:              outcome = this->stop(container, exit_code, stop); break;
        case ContainerStatus::Zombie:               outcome = remove(container, stop); break;
        case ContainerStatus::None:                 break;
    }

    if (!outcome) {
        auto error = outcome.error();
        const bool retryable = error.retryable();
        logger_.warn("Container transition failed", {
            {"task", task.arn()},
            {"container", container.name()},
            {"to", std::string(to_string(next))},
            {"kind", std::string(to_string(error.kind))},
            {"error", error.message},
        });
        return TransitionResult{
            .status = known,
            .error = std::move(error),
            .retryable = retryable,
        };
    }

    if (exit_code) container.set_known_exit_code(*exit_code);
    container.advance_known_status(next);
    return TransitionResult{
        .status = container.known_status(),
        .exit_code = container.known_exit_code(),
    };
}

Result<ContainerInspection> ContainerTransitioner::inspect(const Container& container,
                                                           std::stop_token stop) {
    auto id = container.runtime_id();
    if (id.empty()) {
        return Error{ErrorKind::NotFound, "container " + container.name() + " was never created"};
    }
    return executor_.run_bounded(
        [&driver = driver_, id](std::stop_token call_stop) {
            return driver.inspect_container(id, call_stop);
        },
        timeouts_.inspect, stop, "inspect");
}

// ─────────────────────────────────────────────
// Steps
// ─────────────────────────────────────────────

Result<void> ContainerTransitioner::pull_manifest(Task& task, Container& container,
                                                  std::stop_token stop) {
    task.mark_pull_started(std::chrono::system_clock::now());
    auto digest = executor_.run_bounded(
        [&driver = driver_, image = container.image()](std::stop_token call_stop) {
            return driver.pull_image_manifest(image, call_stop);
        },
        timeouts_.manifest_pull, stop, to_string(ContainerStatus::ManifestPulled));
    if (!digest) return digest.error();

    // An empty digest is a successful pull that resolved nothing reportable.
    container.set_image_digest(*digest);
    return {};
}

Result<void> ContainerTransitioner::pull_image(Task& task, Container& container,
                                               std::stop_token stop) {
    task.mark_pull_started(std::chrono::system_clock::now());
    return executor_.run_bounded(
        [&driver = driver_, image = container.image(),
         digest = container.image_digest()](std::stop_token call_stop) {
            return driver.pull_image(image, digest, call_stop);
        },
        timeouts_.image_pull, stop, to_string(ContainerStatus::Pulled));
}

Result<void> ContainerTransitioner::create(Task& task, Container& container,
                                           std::stop_token stop) {
    const auto& def = container.definition();
    ContainerSpec spec{
        .task_arn = task.arn(),
        .name = def.name,
        .image = def.image,
        .image_digest = container.image_digest(),
        .command = def.command,
        .port_bindings = def.port_bindings,
        .cpu_units = def.cpu_units,
        .memory_mb = def.memory_mb,
    };
    auto id = executor_.run_bounded(
        [&driver = driver_, spec = std::move(spec)](std::stop_token call_stop) {
            return driver.create_container(spec, call_stop);
        },
        timeouts_.create, stop, to_string(ContainerStatus::Created));
    if (!id) return id.error();

    container.set_runtime_id(*id);
    return {};
}

Result<void> ContainerTransitioner::start(Container& container, std::stop_token stop) {
    return executor_.run_bounded(
        [&driver = driver_, id = container.runtime_id()](std::stop_token call_stop) {
            return driver.start_container(id, call_stop);
        },
        timeouts_.start, stop, to_string(ContainerStatus::Running));
}

Result<void> ContainerTransitioner::provision_network(Task& task, Container& container,
                                                      std::stop_token stop) {
    return executor_.run_bounded(
        [&provisioner = provisioner_, arn = task.arn(),
         id = container.runtime_id()](std::stop_token call_stop) {
            return provisioner.setup_task_network(arn, id, call_stop);
        },
        timeouts_.create, stop, to_string(ContainerStatus::ResourcesProvisioned));
}

Result<void> ContainerTransitioner::stop(Container& container, std::optional<int>& exit_code,
                                         std::stop_token stop) {
    auto id = container.runtime_id();
    if (id.empty()) {
        // Never created: nothing to stop in the runtime.
        return {};
    }

    const Duration grace = container.definition().stop_timeout.value_or(timeouts_.stop_grace);
    auto stopped = executor_.run_bounded(
        [&driver = driver_, id, grace](std::stop_token call_stop) {
            return driver.stop_container(id, grace, call_stop);
        },
        grace + timeouts_.stop_slack, stop, to_string(ContainerStatus::Stopped));

    if (!stopped) {
        // The runtime no longer knows the container, so it is not running.
        if (stopped.error().kind == ErrorKind::NotFound) return {};
        return stopped.error();
    }
    if (!container.known_exit_code()) exit_code = *stopped;
    return {};
}

Result<void> ContainerTransitioner::remove(Container& container, std::stop_token stop) {
    auto id = container.runtime_id();
    if (id.empty()) return {};
    return executor_.run_bounded(
        [&driver = driver_, id](std::stop_token call_stop) {
            return driver.remove_container(id, call_stop);
        },
        timeouts_.inspect, stop, to_string(ContainerStatus::Zombie));
}

}  // namespace node_agent
