/**
 * @file provisioner.hpp
 * @brief Task resource and network provisioning interface.
 * @author Dimitris Kafetzis
 *
 * Volumes, secrets, credentials and the task network are set up before any
 * container of the task may be created, and torn down at cleanup.
 */

#pragma once

#include "api/task.hpp"
#include "core/result.hpp"

#include <stop_token>
#include <string>

namespace node_agent {

class IResourceProvisioner {
public:
    virtual ~IResourceProvisioner() = default;

    virtual Result<void> create_resource(const TaskArn& task, const TaskResource& resource,
                                         std::stop_token stop) = 0;

    virtual Result<void> cleanup_resource(const TaskArn& task, const TaskResource& resource,
                                          std::stop_token stop) = 0;

    /// Configure the network namespace held by the task's pause container.
    virtual Result<void> setup_task_network(const TaskArn& task, const RuntimeId& pause_id,
                                            std::stop_token stop) = 0;
};

/**
 * @brief Provisioner for hosts without volume, secret or network plugins.
 */
class NullProvisioner final : public IResourceProvisioner {
public:
    Result<void> create_resource(const TaskArn&, const TaskResource&, std::stop_token) override {
        return {};
    }
    Result<void> cleanup_resource(const TaskArn&, const TaskResource&, std::stop_token) override {
        return {};
    }
    Result<void> setup_task_network(const TaskArn&, const RuntimeId&, std::stop_token) override {
        return {};
    }
};

}  // namespace node_agent
