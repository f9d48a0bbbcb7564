/**
 * @file types.hpp
 * @brief Fundamental types used throughout NodeAgent.
 * @author Dimitris Kafetzis
 *
 * Defines identity aliases, clock aliases and the ResourceRequirements
 * vocabulary type shared by the ledger, the engine and persistence.
 */

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace node_agent {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskArn = std::string;
using ContainerName = std::string;
using RuntimeId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resource Requirements
// ─────────────────────────────────────────────

/**
 * @brief Host resources requested by a task or offered by the host.
 *
 * CPU is expressed in units of 1/1024 of a core. Ports are host ports that
 * must be exclusively reserved for the task.
 */
struct ResourceRequirements {
    uint32_t cpu_units{0};
    uint64_t memory_mb{0};
    std::vector<uint16_t> ports;

    /// True if the CPU and memory of this request fit inside @p available.
    [[nodiscard]] bool fits_within(const ResourceRequirements& available) const noexcept {
        return cpu_units <= available.cpu_units && memory_mb <= available.memory_mb;
    }

    [[nodiscard]] bool uses_port(uint16_t port) const noexcept {
        return std::find(ports.begin(), ports.end(), port) != ports.end();
    }

    bool operator==(const ResourceRequirements&) const = default;
};

}  // namespace node_agent
