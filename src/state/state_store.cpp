/**
 * @file state_store.cpp
 * @brief StateStore implementation.
 * @author Dimitris Kafetzis
 */

#include "state/state_store.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace node_agent {

StateStore::StateStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir))
    , file_(data_dir_ / kFileName) {}

Result<void> StateStore::save(const PersistedState& state, std::string_view agent_version) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        return Error{ErrorKind::Internal,
                     "cannot create data directory " + data_dir_.string() + ": " + ec.message()};
    }

    const auto text = encode_state(state, agent_version);
    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorKind::Internal, "cannot open " + tmp.string() + " for writing"};
        }
        out << text;
        out.flush();
        if (!out) {
            return Error{ErrorKind::Internal, "failed writing " + tmp.string()};
        }
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        return Error{ErrorKind::Internal, "cannot replace " + file_.string() + ": " + reason};
    }
    return {};
}

Result<std::optional<PersistedState>> StateStore::load() const {
    std::ifstream in(file_);
    if (!in) {
        if (!std::filesystem::exists(file_)) return std::optional<PersistedState>{};
        return Error{ErrorKind::Internal, "cannot open " + file_.string()};
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    auto state = decode_state(oss.str());
    if (!state) {
        return Error{state.error().kind, file_.string() + ": " + state.error().message};
    }
    return std::optional<PersistedState>{std::move(*state)};
}

}  // namespace node_agent
