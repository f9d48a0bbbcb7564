/**
 * @file resource_ledger.hpp
 * @brief Host resource accounting for task admission.
 * @author Dimitris Kafetzis
 *
 * Tracks total capacity and per-task consumption. All operations run in a
 * single critical section; no call blocks on anything but the ledger mutex.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace node_agent {

/**
 * @brief Capacity ledger with single admission per task.
 *
 * The capacity's port list holds host ports that are reserved for the
 * agent and never handed to tasks.
 */
class ResourceLedger {
public:
    ResourceLedger(ResourceRequirements capacity, std::vector<std::string> exempt_launch_types);

    ResourceLedger(const ResourceLedger&) = delete;
    ResourceLedger& operator=(const ResourceLedger&) = delete;

    /**
     * @brief Record consumption for @p task if @p requirements fit.
     *
     * Exempt launch types always succeed without being recorded. A task
     * that is already consuming is refused, so admission happens at most
     * once until release.
     */
    [[nodiscard]] bool try_consume(const TaskArn& task, const std::string& launch_type,
                                   const ResourceRequirements& requirements);

    /// Idempotent; unknown tasks are a no-op. Returns true if anything was released.
    bool release(const TaskArn& task);

    [[nodiscard]] bool is_consuming(const TaskArn& task) const;

    [[nodiscard]] bool is_exempt(const std::string& launch_type) const;

    /// True if @p requirements fit an empty host (so waiting can ever succeed).
    [[nodiscard]] bool can_ever_fit(const std::string& launch_type,
                                    const ResourceRequirements& requirements) const;

    [[nodiscard]] ResourceRequirements capacity() const;
    [[nodiscard]] ResourceRequirements consumed() const;
    [[nodiscard]] ResourceRequirements available() const;

    /// Per-task consumption, for persistence.
    [[nodiscard]] std::map<TaskArn, ResourceRequirements> snapshot() const;

    /**
     * @brief Replace all consumption with @p entries, verbatim.
     * @return false if the restored consumption exceeds the current capacity
     *         (capacity shrank across a restart); admission then waits for releases.
     */
    bool restore(const std::map<TaskArn, ResourceRequirements>& entries);

private:
    bool port_taken_locked(uint16_t port) const;

    const ResourceRequirements capacity_;
    const std::vector<std::string> exempt_launch_types_;

    mutable std::mutex mutex_;
    std::map<TaskArn, ResourceRequirements> consumption_;
    uint32_t consumed_cpu_{0};
    uint64_t consumed_memory_{0};
};

}  // namespace node_agent
