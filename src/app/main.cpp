/**
 * @file main.cpp
 * @brief NodeAgent daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a running agent:
 *   Config → Logger → Host capacity → Runtime driver → TaskEngine → Event reporter
 */

#include "api/statechange.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/task_engine.hpp"
#include "host/host_resources.hpp"
#include "runtime/provisioner.hpp"
#include "runtime/simulated_runtime.hpp"
#include "state/task_codec.hpp"
#include "telemetry/json_sink.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace node_agent;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path tasks_path;
    std::string data_dir;
    std::string log_dir;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.tasks_path = argv[++i];
        } else if (arg == "--data-dir" && i + 1 < argc) {
            args.data_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: node_agent [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --tasks <path>     TOML task definitions to submit at startup\n"
                      << "  --data-dir <path>  Directory for persisted agent state\n"
                      << "  --log-dir <path>   Log output directory\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << " (see --help)" << std::endl;
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Stand-in for the control-plane client: logs every handed-off event.
 */
void report_events(std::stop_token stop, Channel<StateChangeEvent>& events, Logger& logger) {
    while (auto event = events.receive(stop)) {
        logger.info("Reporting state change", event_fields(*event));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result && config_result.error().kind != ErrorKind::NotFound) {
        std::cerr << "Invalid config: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.data_dir.empty()) config.agent.data_dir = args.data_dir;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "node_agent",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);

    if (!config_result) {
        logger.warn("Configuration file not found; using defaults",
                    {{"path", args.config_path.string()}});
    }
    logger.info("NodeAgent starting", {
        {"version", std::string(kAgentVersion)},
        {"cluster", config.agent.cluster},
        {"data_dir", config.agent.data_dir.string()},
        {"runtime", config.runtime.driver},
    });

    // ── Host capacity ────────────────────────
    auto capacity = detect_host_capacity(config.resources);
    if (!capacity) {
        logger.error("Host capacity detection failed", {{"error", capacity.error().message}});
        logger.flush();
        return 1;
    }

    // ── Runtime driver ───────────────────────
    if (config.runtime.driver != "simulated") {
        logger.error("Unsupported runtime driver", {{"driver", config.runtime.driver}});
        logger.flush();
        return 1;
    }
    SimulatedRuntime runtime(Duration{config.runtime.simulated_step_delay_ms});
    NullProvisioner provisioner;

    // ── Task engine ──────────────────────────
    TaskEngine engine(TaskEngine::Options{
        .config = config,
        .capacity = *capacity,
        .driver = runtime,
        .provisioner = provisioner,
        .logger = logger,
    });

    if (config.agent.persist_state) {
        if (auto loaded = engine.load_state(); !loaded) {
            logger.error("Could not restore saved state", {{"error", loaded.error().message}});
            logger.flush();
            return 1;
        }
    }

    if (auto started = engine.start(); !started) {
        logger.error("Task engine failed to start", {{"error", started.error().message}});
        logger.flush();
        return 1;
    }

    std::jthread reporter([&engine, &logger](std::stop_token stop) {
        report_events(stop, engine.events(), logger);
    });

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Boot-time task submission ────────────
    if (!args.tasks_path.empty()) {
        auto definitions = load_task_definitions(args.tasks_path);
        if (!definitions) {
            logger.error("Could not load task definitions", {
                {"path", args.tasks_path.string()},
                {"error", definitions.error().message},
            });
        } else {
            for (auto& definition : *definitions) {
                const auto arn = definition.arn;
                if (auto added = engine.add_task(std::move(definition)); !added) {
                    logger.warn("Task rejected", {{"task", arn}, {"error", added.error().message}});
                }
            }
        }
    }

    // ── Main loop ────────────────────────────
    logger.info("Agent running. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            const auto available = engine.ledger().available();
            logger.info("Status", {
                {"managed_tasks", std::to_string(engine.managed_task_count())},
                {"waiting_tasks", std::to_string(engine.waiting_count())},
                {"available_cpu", std::to_string(available.cpu_units)},
                {"available_memory_mb", std::to_string(available.memory_mb)},
            });
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    engine.shutdown();
    reporter.request_stop();
    reporter.join();

    logger.info("NodeAgent stopped.");
    logger.flush();
    return 0;
}
