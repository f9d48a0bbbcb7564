/**
 * @file resource_ledger.cpp
 * @brief ResourceLedger implementation.
 * @author Dimitris Kafetzis
 */

#include "engine/resource_ledger.hpp"

#include <algorithm>
#include <stdexcept>

namespace node_agent {

ResourceLedger::ResourceLedger(ResourceRequirements capacity,
                               std::vector<std::string> exempt_launch_types)
    : capacity_(std::move(capacity))
    , exempt_launch_types_(std::move(exempt_launch_types)) {}

bool ResourceLedger::is_exempt(const std::string& launch_type) const {
    return std::find(exempt_launch_types_.begin(), exempt_launch_types_.end(), launch_type) !=
           exempt_launch_types_.end();
}

bool ResourceLedger::port_taken_locked(uint16_t port) const {
    if (capacity_.uses_port(port)) return true;
    return std::any_of(consumption_.begin(), consumption_.end(),
                       [port](const auto& entry) { return entry.second.uses_port(port); });
}

bool ResourceLedger::try_consume(const TaskArn& task, const std::string& launch_type,
                                 const ResourceRequirements& requirements) {
    if (is_exempt(launch_type)) return true;

    std::lock_guard lock(mutex_);
    if (consumption_.contains(task)) return false;

    if (consumed_cpu_ + requirements.cpu_units > capacity_.cpu_units ||
        consumed_memory_ + requirements.memory_mb > capacity_.memory_mb) {
        return false;
    }
    for (auto port : requirements.ports) {
        if (port_taken_locked(port)) return false;
    }

    consumption_.emplace(task, requirements);
    consumed_cpu_ += requirements.cpu_units;
    consumed_memory_ += requirements.memory_mb;
    return true;
}

bool ResourceLedger::release(const TaskArn& task) {
    std::lock_guard lock(mutex_);
    auto it = consumption_.find(task);
    if (it == consumption_.end()) return false;

    if (it->second.cpu_units > consumed_cpu_ || it->second.memory_mb > consumed_memory_) {
        throw std::logic_error("resource ledger underflow releasing " + task);
    }
    consumed_cpu_ -= it->second.cpu_units;
    consumed_memory_ -= it->second.memory_mb;
    consumption_.erase(it);
    return true;
}

bool ResourceLedger::is_consuming(const TaskArn& task) const {
    std::lock_guard lock(mutex_);
    return consumption_.contains(task);
}

bool ResourceLedger::can_ever_fit(const std::string& launch_type,
                                  const ResourceRequirements& requirements) const {
    if (is_exempt(launch_type)) return true;
    if (!requirements.fits_within(capacity_)) return false;
    return std::none_of(requirements.ports.begin(), requirements.ports.end(),
                        [this](uint16_t port) { return capacity_.uses_port(port); });
}

ResourceRequirements ResourceLedger::capacity() const {
    return capacity_;
}

ResourceRequirements ResourceLedger::consumed() const {
    std::lock_guard lock(mutex_);
    ResourceRequirements total{.cpu_units = consumed_cpu_, .memory_mb = consumed_memory_};
    for (const auto& [task, requirements] : consumption_) {
        total.ports.insert(total.ports.end(), requirements.ports.begin(), requirements.ports.end());
    }
    return total;
}

ResourceRequirements ResourceLedger::available() const {
    std::lock_guard lock(mutex_);
    return ResourceRequirements{
        .cpu_units = consumed_cpu_ < capacity_.cpu_units ? capacity_.cpu_units - consumed_cpu_ : 0,
        .memory_mb = consumed_memory_ < capacity_.memory_mb ? capacity_.memory_mb - consumed_memory_ : 0,
    };
}

std::map<TaskArn, ResourceRequirements> ResourceLedger::snapshot() const {
    std::lock_guard lock(mutex_);
    return consumption_;
}

bool ResourceLedger::restore(const std::map<TaskArn, ResourceRequirements>& entries) {
    std::lock_guard lock(mutex_);
    consumption_ = entries;
    consumed_cpu_ = 0;
    consumed_memory_ = 0;
    for (const auto& [task, requirements] : consumption_) {
        consumed_cpu_ += requirements.cpu_units;
        consumed_memory_ += requirements.memory_mb;
    }
    return consumed_cpu_ <= capacity_.cpu_units && consumed_memory_ <= capacity_.memory_mb;
}

}  // namespace node_agent
