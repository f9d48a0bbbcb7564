/**
 * @file container.cpp
 * @brief Container accessors.
 * @author Dimitris Kafetzis
 */

#include "api/container.hpp"

#include <algorithm>
#include <cctype>

namespace node_agent {

std::optional<ContainerKind> parse_container_kind(std::string_view text) noexcept {
    for (auto kind : {ContainerKind::Normal, ContainerKind::Pause, ContainerKind::ManagedDaemon}) {
        if (to_string(kind) == text) return kind;
    }
    return std::nullopt;
}

std::optional<DependencyCondition> parse_dependency_condition(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto condition : {DependencyCondition::Start, DependencyCondition::Complete,
                           DependencyCondition::Success, DependencyCondition::Healthy}) {
        if (to_string(condition) == upper) return condition;
    }
    return std::nullopt;
}

Container::Container(ContainerDefinition definition) : def_(std::move(definition)) {
    for (const auto& agent_name : def_.managed_agents) {
        state_.managed_agents.push_back(ManagedAgent{.name = agent_name});
    }
}

// ── Statuses ─────────────────────────────────

ContainerStatus Container::known_status() const {
    std::lock_guard lock(mutex_);
    return state_.known_status;
}

bool Container::advance_known_status(ContainerStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.known_status) return false;
    state_.known_status = status;
    return true;
}

ContainerStatus Container::desired_status() const {
    std::lock_guard lock(mutex_);
    return state_.desired_status;
}

bool Container::set_desired_status(ContainerStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.desired_status) return false;
    state_.desired_status = status;
    return true;
}

ContainerStatus Container::sent_status() const {
    std::lock_guard lock(mutex_);
    return state_.sent_status;
}

bool Container::set_sent_status(ContainerStatus status) {
    std::lock_guard lock(mutex_);
    if (status <= state_.sent_status || status > state_.known_status) return false;
    state_.sent_status = status;
    return true;
}

bool Container::is_known_steady_state() const {
    return known_status() == steady_state_status();
}

// ── Runtime data ─────────────────────────────

std::optional<int> Container::known_exit_code() const {
    std::lock_guard lock(mutex_);
    return state_.exit_code;
}

void Container::set_known_exit_code(int code) {
    std::lock_guard lock(mutex_);
    state_.exit_code = code;
}

HealthStatus Container::health_status() const {
    std::lock_guard lock(mutex_);
    return state_.health;
}

void Container::set_health_status(HealthStatus status) {
    std::lock_guard lock(mutex_);
    state_.health = status;
}

RuntimeId Container::runtime_id() const {
    std::lock_guard lock(mutex_);
    return state_.runtime_id;
}

void Container::set_runtime_id(RuntimeId id) {
    std::lock_guard lock(mutex_);
    state_.runtime_id = std::move(id);
}

std::string Container::image_digest() const {
    std::lock_guard lock(mutex_);
    return state_.image_digest;
}

void Container::set_image_digest(std::string digest) {
    std::lock_guard lock(mutex_);
    state_.image_digest = std::move(digest);
}

bool Container::digest_resolved() const {
    std::lock_guard lock(mutex_);
    return !state_.image_digest.empty();
}

std::string Container::applying_error() const {
    std::lock_guard lock(mutex_);
    return state_.applying_error;
}

void Container::set_applying_error(std::string reason) {
    std::lock_guard lock(mutex_);
    state_.applying_error = std::move(reason);
}

std::vector<ManagedAgent> Container::managed_agents() const {
    std::lock_guard lock(mutex_);
    return state_.managed_agents;
}

bool Container::set_managed_agent_status(const std::string& name, ManagedAgentStatus status,
                                         std::string reason) {
    std::lock_guard lock(mutex_);
    for (auto& agent : state_.managed_agents) {
        if (agent.name != name) continue;
        if (status <= agent.status) return false;
        agent.status = status;
        agent.reason = std::move(reason);
        return true;
    }
    return false;
}

void Container::set_managed_agent_sent_status(const std::string& name, ManagedAgentStatus status) {
    std::lock_guard lock(mutex_);
    for (auto& agent : state_.managed_agents) {
        if (agent.name == name && status > agent.sent_status) {
            agent.sent_status = status;
        }
    }
}

ContainerState Container::snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

void Container::restore(const ContainerState& state) {
    std::lock_guard lock(mutex_);
    state_ = state;
}

}  // namespace node_agent
