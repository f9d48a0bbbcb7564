/**
 * @file host_resources.hpp
 * @brief Host capacity detection from Linux pseudo-filesystems.
 * @author Dimitris Kafetzis
 *
 * Data sources:
 *   /proc/stat     — one "cpuN" line per online CPU
 *   /proc/meminfo  — MemTotal
 *
 * The parse helpers operate on file contents so they can be tested with
 * fixed text.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string_view>

namespace node_agent {

/// CPU units granted per online CPU.
inline constexpr uint32_t kCpuUnitsPerCore = 1024;

/// MemTotal from /proc/meminfo contents, in MiB (0 if absent).
[[nodiscard]] uint64_t parse_meminfo_total_mb(std::string_view meminfo);

/// Number of per-CPU lines ("cpu0", "cpu1", ...) in /proc/stat contents.
[[nodiscard]] uint32_t count_cpu_lines(std::string_view proc_stat);

/**
 * @brief Total host capacity the ledger may hand out.
 *
 * Non-zero configured values override detection. Reserved memory is
 * subtracted; reserved ports become the capacity's port list.
 */
[[nodiscard]] Result<ResourceRequirements> detect_host_capacity(const ResourcesConfig& config);

}  // namespace node_agent
