/**
 * @file simulated_runtime.cpp
 * @brief SimulatedRuntime implementation.
 * @author Dimitris Kafetzis
 */

#include "runtime/simulated_runtime.hpp"

#include <cstdio>
#include <functional>

namespace node_agent {

namespace {

constexpr size_t index_of(RuntimeOperation op) noexcept {
    return static_cast<size_t>(op);
}

std::string default_digest(const std::string& image) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%016zx", std::hash<std::string>{}(image));
    return "sha256:" + std::string(buf);
}

}  // namespace

SimulatedRuntime::SimulatedRuntime(Duration step_delay) : step_delay_(step_delay) {
    delays_.fill(Duration::zero());
    calls_.fill(0);
}

// ── Call plumbing ────────────────────────────

bool SimulatedRuntime::interruptible_sleep(Duration delay, std::stop_token stop) {
    if (delay <= Duration::zero()) return !stop.stop_requested();
    std::unique_lock lock(mutex_);
    // Nothing ever notifies sleep_cv_; only the stop_token or the timeout wakes it.
    sleep_cv_.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

Result<void> SimulatedRuntime::enter(RuntimeOperation op, const std::string& target,
                                     std::stop_token stop) {
    Duration delay{0};
    {
        std::lock_guard lock(mutex_);
        ++calls_[index_of(op)];
        delay = step_delay_ + delays_[index_of(op)];
    }

    if (!interruptible_sleep(delay, stop)) {
        return Error(ErrorKind::Cancelled, std::string(to_string(op)) + ": cancelled");
    }

    std::lock_guard lock(mutex_);
    auto& queue = faults_[index_of(op)];
    for (auto it = queue.begin(); it != queue.end(); ++it) {
        if (!it->target.empty() && it->target != target) continue;
        Error error(it->kind, it->message);
        if (--it->remaining == 0) queue.erase(it);
        return error;
    }
    return {};
}

void SimulatedRuntime::refresh_locked(SimContainer& container) {
    if (container.status != ContainerStatus::Running) return;
    auto script = scripts_.find(container.spec.name);
    if (script == scripts_.end() || !script->second.exit_code) return;
    if (std::chrono::steady_clock::now() - container.started_at >= script->second.exit_after) {
        container.status = ContainerStatus::Stopped;
        container.exit_code = script->second.exit_code;
    }
}

// ── IRuntimeDriver ───────────────────────────

Result<std::string> SimulatedRuntime::pull_image_manifest(const std::string& image,
                                                          std::stop_token stop) {
    if (auto entered = enter(RuntimeOperation::PullManifest, image, stop); !entered) {
        return entered.error();
    }
    std::lock_guard lock(mutex_);
    auto it = digests_.find(image);
    if (it != digests_.end()) return it->second;
    return default_digest(image);
}

Result<void> SimulatedRuntime::pull_image(const std::string& image, const std::string& /*digest*/,
                                          std::stop_token stop) {
    return enter(RuntimeOperation::PullImage, image, stop);
}

Result<RuntimeId> SimulatedRuntime::create_container(const ContainerSpec& spec,
                                                     std::stop_token stop) {
    if (auto entered = enter(RuntimeOperation::Create, spec.name, stop); !entered) {
        return entered.error();
    }
    std::lock_guard lock(mutex_);
    RuntimeId id = "sim-" + std::to_string(next_id_++);
    containers_.emplace(id, SimContainer{.spec = spec});
    return id;
}

Result<void> SimulatedRuntime::start_container(const RuntimeId& id, std::stop_token stop) {
    std::string name;
    {
        std::lock_guard lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            return Error(ErrorKind::Terminal, "no such container: " + id);
        }
        name = it->second.spec.name;
    }
    if (auto entered = enter(RuntimeOperation::Start, name, stop); !entered) {
        return entered.error();
    }
    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error(ErrorKind::Terminal, "no such container: " + id);
    }
    it->second.status = ContainerStatus::Running;
    it->second.started_at = std::chrono::steady_clock::now();
    return {};
}

Result<int> SimulatedRuntime::stop_container(const RuntimeId& id, Duration grace,
                                             std::stop_token stop) {
    std::string name;
    bool ignores_stop = false;
    {
        std::lock_guard lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            return Error(ErrorKind::NotFound, "no such container: " + id);
        }
        refresh_locked(it->second);
        if (it->second.status == ContainerStatus::Stopped) {
            ++calls_[index_of(RuntimeOperation::Stop)];
            return it->second.exit_code.value_or(0);
        }
        name = it->second.spec.name;
        auto script = scripts_.find(name);
        ignores_stop = script != scripts_.end() && script->second.ignores_stop;
    }

    if (auto entered = enter(RuntimeOperation::Stop, name, stop); !entered) {
        return entered.error();
    }
    if (ignores_stop && !interruptible_sleep(grace, stop)) {
        return Error(ErrorKind::Cancelled, "stop_container: cancelled");
    }

    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error(ErrorKind::NotFound, "no such container: " + id);
    }
    it->second.status = ContainerStatus::Stopped;
    it->second.exit_code = ignores_stop ? kKilledExitCode : 0;
    return *it->second.exit_code;
}

Result<ContainerInspection> SimulatedRuntime::inspect_container(const RuntimeId& id,
                                                                std::stop_token stop) {
    std::string name;
    {
        std::lock_guard lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) {
            return Error(ErrorKind::NotFound, "no such container: " + id);
        }
        name = it->second.spec.name;
    }
    if (auto entered = enter(RuntimeOperation::Inspect, name, stop); !entered) {
        return entered.error();
    }

    std::lock_guard lock(mutex_);
    auto it = containers_.find(id);
    if (it == containers_.end()) {
        return Error(ErrorKind::NotFound, "no such container: " + id);
    }
    refresh_locked(it->second);

    ContainerInspection inspection{
        .status = it->second.status,
        .exit_code = it->second.exit_code,
    };
    if (auto script = scripts_.find(name); script != scripts_.end()) {
        inspection.health = script->second.health;
    }
    return inspection;
}

Result<void> SimulatedRuntime::remove_container(const RuntimeId& id, std::stop_token stop) {
    std::string name;
    {
        std::lock_guard lock(mutex_);
        auto it = containers_.find(id);
        if (it == containers_.end()) return {};
        name = it->second.spec.name;
    }
    if (auto entered = enter(RuntimeOperation::Remove, name, stop); !entered) {
        return entered.error();
    }
    std::lock_guard lock(mutex_);
    containers_.erase(id);
    return {};
}

// ── Test helpers ─────────────────────────────

void SimulatedRuntime::set_image_digest(const std::string& image, std::string digest) {
    std::lock_guard lock(mutex_);
    digests_[image] = std::move(digest);
}

void SimulatedRuntime::inject_failure(RuntimeOperation op, ErrorKind kind, std::string message,
                                      size_t times, std::string target) {
    if (times == 0) return;
    std::lock_guard lock(mutex_);
    faults_[index_of(op)].push_back(Fault{
        .kind = kind,
        .message = std::move(message),
        .remaining = times,
        .target = std::move(target),
    });
}

void SimulatedRuntime::set_delay(RuntimeOperation op, Duration delay) {
    std::lock_guard lock(mutex_);
    delays_[index_of(op)] = delay;
}

void SimulatedRuntime::script_exit(const ContainerName& name, int exit_code, Duration after) {
    std::lock_guard lock(mutex_);
    auto& script = scripts_[name];
    script.exit_code = exit_code;
    script.exit_after = after;
}

void SimulatedRuntime::set_health(const ContainerName& name, HealthStatus health) {
    std::lock_guard lock(mutex_);
    scripts_[name].health = health;
}

void SimulatedRuntime::ignore_stop_signal(const ContainerName& name) {
    std::lock_guard lock(mutex_);
    scripts_[name].ignores_stop = true;
}

size_t SimulatedRuntime::call_count(RuntimeOperation op) const {
    std::lock_guard lock(mutex_);
    return calls_[index_of(op)];
}

size_t SimulatedRuntime::running_count() const {
    std::lock_guard lock(mutex_);
    size_t count = 0;
    for (const auto& [id, container] : containers_) {
        if (container.status == ContainerStatus::Running) ++count;
    }
    return count;
}

size_t SimulatedRuntime::container_count() const {
    std::lock_guard lock(mutex_);
    return containers_.size();
}

std::optional<ContainerStatus> SimulatedRuntime::status_of(const TaskArn& task,
                                                           const ContainerName& name) const {
    std::lock_guard lock(mutex_);
    for (const auto& [id, container] : containers_) {
        if (container.spec.task_arn == task && container.spec.name == name) {
            return container.status;
        }
    }
    return std::nullopt;
}

}  // namespace node_agent
