/**
 * @file state_store.hpp
 * @brief Atomic file persistence of the agent state document.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "state/task_codec.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace node_agent {

class StateStore {
public:
    explicit StateStore(std::filesystem::path data_dir);

    /// Write to a temporary file in the data directory, then rename over the state file.
    Result<void> save(const PersistedState& state, std::string_view agent_version);

    /// std::nullopt when no state has been saved yet.
    Result<std::optional<PersistedState>> load() const;

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    static constexpr std::string_view kFileName = "agent_state.toml";

private:
    std::filesystem::path data_dir_;
    std::filesystem::path file_;
};

}  // namespace node_agent
