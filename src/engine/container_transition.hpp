/**
 * @file container_transition.hpp
 * @brief Single-step container state progression through the runtime driver.
 * @author Dimitris Kafetzis
 *
 * progress() performs exactly one step toward the requested target: it
 * picks the next status, issues the matching runtime or provisioner call
 * bounded by that step's timeout, and on success advances the container's
 * known status. On failure the known status stays where it was and the
 * result says whether the step may be retried.
 */

#pragma once

#include "api/container.hpp"
#include "api/task.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/call_executor.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/runtime_driver.hpp"

#include <optional>
#include <stop_token>

namespace node_agent {

struct TransitionTimeouts {
    Duration manifest_pull{60000};
    Duration image_pull{300000};
    Duration create{240000};
    Duration start{180000};
    Duration inspect{30000};
    Duration stop_grace{30000};    ///< Default grace before the runtime kills a container
    Duration stop_slack{5000};     ///< Extra time allowed for the stop call itself

    static TransitionTimeouts from_config(const EngineConfig& config);
};

struct TransitionResult {
    ContainerStatus status{ContainerStatus::None};   ///< Known status after the step
    std::optional<Error> error;
    std::optional<int> exit_code;
    bool retryable{false};

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/**
 * @brief Next status on the way from @p known to @p target for a container of @p kind.
 *
 * Returns @p known when no further step applies. Stopping jumps straight to
 * STOPPED from any earlier status; ZOMBIE follows STOPPED.
 */
[[nodiscard]] ContainerStatus next_status(ContainerStatus known, ContainerStatus target,
                                          ContainerKind kind) noexcept;

class ContainerTransitioner {
public:
    ContainerTransitioner(IRuntimeDriver& driver, IResourceProvisioner& provisioner,
                          CallExecutor& executor, TransitionTimeouts timeouts, Logger& logger);

    /// Take one step toward @p target. A target at or below the known status is a no-op.
    TransitionResult progress(Task& task, Container& container, ContainerStatus target,
                              std::stop_token stop);

    /// Inspect a created container, bounded by the inspect timeout.
    Result<ContainerInspection> inspect(const Container& container, std::stop_token stop);

    [[nodiscard]] const TransitionTimeouts& timeouts() const noexcept { return timeouts_; }

private:
    Result<void> pull_manifest(Task& task, Container& container, std::stop_token stop);
    Result<void> pull_image(Task& task, Container& container, std::stop_token stop);
    Result<void> create(Task& task, Container& container, std::stop_token stop);
    Result<void> start(Container& container, std::stop_token stop);
    Result<void> provision_network(Task& task, Container& container, std::stop_token stop);
    Result<void> stop(Container& container, std::optional<int>& exit_code, std::stop_token stop);
    Result<void> remove(Container& container, std::stop_token stop);

    IRuntimeDriver& driver_;
    IResourceProvisioner& provisioner_;
    CallExecutor& executor_;
    TransitionTimeouts timeouts_;
    Logger& logger_;
};

}  // namespace node_agent
