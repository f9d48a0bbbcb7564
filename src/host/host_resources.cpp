/**
 * @file host_resources.cpp
 * @brief /proc parsing for host capacity.
 * @author Dimitris Kafetzis
 */

#include "host/host_resources.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace node_agent {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::ostringstream oss;
    if (ifs.is_open()) {
        oss << ifs.rdbuf();
    }
    return oss.str();
}

}  // namespace

uint64_t parse_meminfo_total_mb(std::string_view meminfo) {
    std::istringstream iss{std::string(meminfo)};
    std::string line;
    while (std::getline(iss, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream fields(line.substr(9));
            uint64_t total_kb = 0;
            fields >> total_kb;
            return total_kb / 1024;
        }
    }
    return 0;
}

uint32_t count_cpu_lines(std::string_view proc_stat) {
    std::istringstream iss{std::string(proc_stat)};
    std::string line;
    uint32_t count = 0;
    while (std::getline(iss, line)) {
        // "cpu " is the aggregate line; per-core lines carry an index
        if (line.size() > 3 && line.starts_with("cpu") &&
            std::isdigit(static_cast<unsigned char>(line[3]))) {
            ++count;
        }
    }
    return count;
}

Result<ResourceRequirements> detect_host_capacity(const ResourcesConfig& config) {
    ResourceRequirements capacity;

    capacity.cpu_units = config.cpu_units;
    if (capacity.cpu_units == 0) {
        capacity.cpu_units = count_cpu_lines(read_file("/proc/stat")) * kCpuUnitsPerCore;
    }

    uint64_t memory_mb = config.memory_mb;
    if (memory_mb == 0) {
        memory_mb = parse_meminfo_total_mb(read_file("/proc/meminfo"));
    }

    if (capacity.cpu_units == 0 || memory_mb == 0) {
        return Error{ErrorKind::Configuration,
                     "could not detect host capacity; set resources.cpu_units and resources.memory_mb"};
    }
    if (config.reserved_memory_mb >= memory_mb) {
        return Error{ErrorKind::Configuration,
                     "reserved_memory_mb (" + std::to_string(config.reserved_memory_mb) +
                         ") leaves no memory for tasks (" + std::to_string(memory_mb) + " MiB)"};
    }

    capacity.memory_mb = memory_mb - config.reserved_memory_mb;
    capacity.ports = config.reserved_ports;
    return capacity;
}

}  // namespace node_agent
