/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for NodeAgent call sites.
 * @author Dimitris Kafetzis
 *
 * Runtime-driver calls are submitted to the call executor as callables
 * taking a stop_token and returning a Result. The concepts below constrain
 * those callables at compile time.
 */

#pragma once

#include "core/result.hpp"

#include <concepts>
#include <stop_token>
#include <type_traits>

namespace node_agent {

// ─────────────────────────────────────────────
// Result detection
// ─────────────────────────────────────────────

template <typename T>
struct is_result : std::false_type {};

template <typename T, typename E>
struct is_result<Result<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool is_result_v = is_result<std::remove_cvref_t<T>>::value;

// ─────────────────────────────────────────────
// DriverCall
// ─────────────────────────────────────────────

/**
 * @concept DriverCall
 * @brief A cancellable runtime operation: F(stop_token) -> Result<T>.
 *
 * The result type must be constructible from an Error so that the executor
 * can report Timeout and Cancelled outcomes in place of the call's own.
 */
template <typename F>
concept DriverCall =
    std::invocable<F, std::stop_token> &&
    is_result_v<std::invoke_result_t<F, std::stop_token>> &&
    std::constructible_from<std::invoke_result_t<F, std::stop_token>, Error>;

}  // namespace node_agent
