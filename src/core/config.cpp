/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace node_agent {

namespace {

template <typename T>
T read_uint(toml::node_view<toml::node> table, std::string_view key, T fallback) {
    return static_cast<T>(table[key].value_or(static_cast<int64_t>(fallback)));
}

std::vector<uint16_t> read_ports(const toml::array& arr) {
    std::vector<uint16_t> ports;
    for (const auto& elem : arr) {
        if (auto port = elem.value<int64_t>(); port && *port > 0 && *port <= 65535) {
            ports.push_back(static_cast<uint16_t>(*port));
        }
    }
    return ports;
}

std::vector<std::string> read_strings(const toml::array& arr) {
    std::vector<std::string> values;
    for (const auto& elem : arr) {
        if (auto text = elem.value<std::string>()) {
            values.push_back(*text);
        }
    }
    return values;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [agent]
        if (auto agent = tbl["agent"]; agent.is_table()) {
            config.agent.cluster = agent["cluster"].value_or(config.agent.cluster);
            config.agent.data_dir = agent["data_dir"].value_or(config.agent.data_dir.string());
            config.agent.persist_state = agent["persist_state"].value_or(config.agent.persist_state);
            config.agent.state_save_interval_ms =
                read_uint(agent, "state_save_interval_ms", config.agent.state_save_interval_ms);
        }

        // [resources]
        if (auto resources = tbl["resources"]; resources.is_table()) {
            config.resources.cpu_units =
                read_uint(resources, "cpu_units", config.resources.cpu_units);
            config.resources.memory_mb =
                read_uint(resources, "memory_mb", config.resources.memory_mb);
            config.resources.reserved_memory_mb =
                read_uint(resources, "reserved_memory_mb", config.resources.reserved_memory_mb);
            if (const auto* ports = resources["reserved_ports"].as_array()) {
                config.resources.reserved_ports = read_ports(*ports);
            }
            if (const auto* exempt = resources["exempt_launch_types"].as_array()) {
                config.resources.exempt_launch_types = read_strings(*exempt);
            }
        }

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            auto& e = config.engine;
            e.container_stop_timeout_ms =
                read_uint(engine, "container_stop_timeout_ms", e.container_stop_timeout_ms);
            e.stop_call_slack_ms = read_uint(engine, "stop_call_slack_ms", e.stop_call_slack_ms);
            e.manifest_pull_timeout_ms =
                read_uint(engine, "manifest_pull_timeout_ms", e.manifest_pull_timeout_ms);
            e.image_pull_timeout_ms =
                read_uint(engine, "image_pull_timeout_ms", e.image_pull_timeout_ms);
            e.create_timeout_ms = read_uint(engine, "create_timeout_ms", e.create_timeout_ms);
            e.start_timeout_ms = read_uint(engine, "start_timeout_ms", e.start_timeout_ms);
            e.inspect_timeout_ms = read_uint(engine, "inspect_timeout_ms", e.inspect_timeout_ms);
            e.steady_state_poll_interval_ms =
                read_uint(engine, "steady_state_poll_interval_ms", e.steady_state_poll_interval_ms);
            e.task_cleanup_wait_ms =
                read_uint(engine, "task_cleanup_wait_ms", e.task_cleanup_wait_ms);
            e.max_transition_attempts =
                read_uint(engine, "max_transition_attempts", e.max_transition_attempts);
            e.retry_backoff_ms = read_uint(engine, "retry_backoff_ms", e.retry_backoff_ms);
            e.runtime_workers = read_uint(engine, "runtime_workers", e.runtime_workers);
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            config.runtime.driver = runtime["driver"].value_or(config.runtime.driver);
            config.runtime.simulated_step_delay_ms =
                read_uint(runtime, "simulated_step_delay_ms", config.runtime.simulated_step_delay_ms);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir =
                telemetry["log_dir"].value_or(config.telemetry.log_dir.string());
            config.telemetry.max_file_size_mb =
                read_uint(telemetry, "max_file_size_mb", config.telemetry.max_file_size_mb);
            config.telemetry.rotate_count =
                read_uint(telemetry, "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level =
                telemetry["log_level"].value_or(config.telemetry.log_level);
        }

        if (config.engine.max_transition_attempts == 0) {
            return Error{ErrorKind::Configuration, "engine.max_transition_attempts must be at least 1"};
        }
        if (config.engine.runtime_workers == 0) {
            return Error{ErrorKind::Configuration, "engine.runtime_workers must be at least 1"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace node_agent
