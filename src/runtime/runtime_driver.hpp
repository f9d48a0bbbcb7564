/**
 * @file runtime_driver.hpp
 * @brief Container runtime driver interface.
 * @author Dimitris Kafetzis
 *
 * The driver is chosen at startup from configuration, so it is a virtual
 * interface. Every call is cancellable through its stop_token and reports
 * failures through Result with a classifying ErrorKind.
 */

#pragma once

#include "api/container.hpp"
#include "api/status.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace node_agent {

/**
 * @brief Everything the runtime needs to create one container.
 */
struct ContainerSpec {
    TaskArn task_arn;
    ContainerName name;
    std::string image;
    std::string image_digest;
    std::vector<std::string> command;
    std::vector<PortBinding> port_bindings;
    uint32_t cpu_units{0};
    uint64_t memory_mb{0};
};

/**
 * @brief Result of inspecting a container.
 *
 * status is CREATED, RUNNING or STOPPED; exit_code is set once the process exited.
 */
struct ContainerInspection {
    ContainerStatus status{ContainerStatus::None};
    std::optional<int> exit_code;
    HealthStatus health{HealthStatus::Unknown};
};

// ─────────────────────────────────────────────
// IRuntimeDriver (virtual: chosen at startup)
// ─────────────────────────────────────────────

class IRuntimeDriver {
public:
    virtual ~IRuntimeDriver() = default;

    /// Resolve an image reference to a content digest.
    virtual Result<std::string> pull_image_manifest(const std::string& image,
                                                    std::stop_token stop) = 0;

    virtual Result<void> pull_image(const std::string& image, const std::string& digest,
                                    std::stop_token stop) = 0;

    virtual Result<RuntimeId> create_container(const ContainerSpec& spec,
                                               std::stop_token stop) = 0;

    virtual Result<void> start_container(const RuntimeId& id, std::stop_token stop) = 0;

    /**
     * @brief Ask the container to exit, killing it once @p grace elapses.
     * @return The exit code of the stopped container.
     */
    virtual Result<int> stop_container(const RuntimeId& id, Duration grace,
                                       std::stop_token stop) = 0;

    virtual Result<ContainerInspection> inspect_container(const RuntimeId& id,
                                                          std::stop_token stop) = 0;

    virtual Result<void> remove_container(const RuntimeId& id, std::stop_token stop) = 0;
};

}  // namespace node_agent
