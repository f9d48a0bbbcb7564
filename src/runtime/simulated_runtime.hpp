/**
 * @file simulated_runtime.hpp
 * @brief In-memory container runtime for the daemon's simulated mode and tests.
 * @author Dimitris Kafetzis
 *
 * Behaves like a cooperative container daemon: images resolve to stable
 * digests, containers move through created/running/stopped and can be
 * scripted to exit, report health, fail, or ignore stop signals.
 */

#pragma once

#include "runtime/runtime_driver.hpp"

#include <array>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace node_agent {

enum class RuntimeOperation : uint8_t {
    PullManifest,
    PullImage,
    Create,
    Start,
    Stop,
    Inspect,
    Remove
};

inline constexpr size_t kRuntimeOperationCount = 7;

[[nodiscard]] constexpr std::string_view to_string(RuntimeOperation op) noexcept {
    switch (op) {
        case RuntimeOperation::PullManifest: return "pull_image_manifest";
        case RuntimeOperation::PullImage:    return "pull_image";
        case RuntimeOperation::Create:       return "create_container";
        case RuntimeOperation::Start:        return "start_container";
        case RuntimeOperation::Stop:         return "stop_container";
        case RuntimeOperation::Inspect:      return "inspect_container";
        case RuntimeOperation::Remove:       return "remove_container";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// SimulatedRuntime
// ─────────────────────────────────────────────

class SimulatedRuntime final : public IRuntimeDriver {
public:
    explicit SimulatedRuntime(Duration step_delay = Duration::zero());

    // IRuntimeDriver interface
    Result<std::string> pull_image_manifest(const std::string& image, std::stop_token stop) override;
    Result<void> pull_image(const std::string& image, const std::string& digest,
                            std::stop_token stop) override;
    Result<RuntimeId> create_container(const ContainerSpec& spec, std::stop_token stop) override;
    Result<void> start_container(const RuntimeId& id, std::stop_token stop) override;
    Result<int> stop_container(const RuntimeId& id, Duration grace, std::stop_token stop) override;
    Result<ContainerInspection> inspect_container(const RuntimeId& id, std::stop_token stop) override;
    Result<void> remove_container(const RuntimeId& id, std::stop_token stop) override;

    // Test helpers: configure how the runtime behaves

    /// An empty digest makes the manifest pull succeed without resolving one.
    void set_image_digest(const std::string& image, std::string digest);

    /// Fail the next @p times calls of @p op whose image or container name matches @p target
    /// (empty target matches every call).
    void inject_failure(RuntimeOperation op, ErrorKind kind, std::string message,
                        size_t times = 1, std::string target = {});

    /// Delay every call of @p op; the delay is interrupted by the call's stop_token.
    void set_delay(RuntimeOperation op, Duration delay);

    /// Container @p name exits with @p exit_code once it has run for @p after.
    void script_exit(const ContainerName& name, int exit_code, Duration after = Duration::zero());

    void set_health(const ContainerName& name, HealthStatus health);

    /// Container @p name ignores the stop signal and is killed (exit 137) after the grace period.
    void ignore_stop_signal(const ContainerName& name);

    [[nodiscard]] size_t call_count(RuntimeOperation op) const;
    [[nodiscard]] size_t running_count() const;
    [[nodiscard]] size_t container_count() const;
    [[nodiscard]] std::optional<ContainerStatus> status_of(const TaskArn& task,
                                                           const ContainerName& name) const;

    static constexpr int kKilledExitCode = 137;

private:
    struct SimContainer {
        ContainerSpec spec;
        ContainerStatus status{ContainerStatus::Created};
        std::optional<int> exit_code;
        SteadyTime started_at{};
    };

    struct Fault {
        ErrorKind kind;
        std::string message;
        size_t remaining;
        std::string target;
    };

    struct Script {
        std::optional<int> exit_code;
        Duration exit_after{0};
        HealthStatus health{HealthStatus::Unknown};
        bool ignores_stop{false};
    };

    /// Count the call, apply its delay and any matching fault.
    Result<void> enter(RuntimeOperation op, const std::string& target, std::stop_token stop);

    /// Sleep for @p delay unless @p stop fires first; false if interrupted.
    bool interruptible_sleep(Duration delay, std::stop_token stop);

    /// Apply a scripted exit if its time has come. Caller holds mutex_.
    void refresh_locked(SimContainer& container);

    Duration step_delay_;

    mutable std::mutex mutex_;
    std::condition_variable_any sleep_cv_;
    std::map<std::string, std::string> digests_;
    std::unordered_map<RuntimeId, SimContainer> containers_;
    std::map<ContainerName, Script> scripts_;
    std::array<std::deque<Fault>, kRuntimeOperationCount> faults_{};
    std::array<Duration, kRuntimeOperationCount> delays_{};
    std::array<size_t, kRuntimeOperationCount> calls_{};
    uint64_t next_id_{1};
};

}  // namespace node_agent
