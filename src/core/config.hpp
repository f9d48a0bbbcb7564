/**
 * @file config.hpp
 * @brief Agent configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace node_agent {

struct AgentConfig {
    std::string cluster = "default";
    std::filesystem::path data_dir = "./data";
    bool persist_state = true;
    uint32_t state_save_interval_ms = 60000;
};

struct ResourcesConfig {
    uint32_t cpu_units = 0;              ///< 0 = detect from /proc/stat
    uint64_t memory_mb = 0;              ///< 0 = detect from /proc/meminfo
    uint64_t reserved_memory_mb = 0;
    std::vector<uint16_t> reserved_ports = {22, 2375, 2376, 51678, 51679};
    std::vector<std::string> exempt_launch_types = {"FARGATE"};
};

struct EngineConfig {
    uint32_t container_stop_timeout_ms = 30000;
    uint32_t stop_call_slack_ms = 5000;
    uint32_t manifest_pull_timeout_ms = 60000;
    uint32_t image_pull_timeout_ms = 300000;
    uint32_t create_timeout_ms = 240000;
    uint32_t start_timeout_ms = 180000;
    uint32_t inspect_timeout_ms = 30000;
    uint32_t steady_state_poll_interval_ms = 5000;
    uint64_t task_cleanup_wait_ms = 3ULL * 60 * 60 * 1000;
    uint32_t max_transition_attempts = 3;
    uint32_t retry_backoff_ms = 1000;
    uint32_t runtime_workers = 8;
};

struct RuntimeConfig {
    std::string driver = "simulated";
    uint32_t simulated_step_delay_ms = 0;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level agent configuration.
 */
struct Config {
    AgentConfig agent;
    ResourcesConfig resources;
    EngineConfig engine;
    RuntimeConfig runtime;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace node_agent
