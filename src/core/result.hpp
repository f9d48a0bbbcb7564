/**
 * @file result.hpp
 * @brief Monadic error handling type for NodeAgent.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors are
 * classified by ErrorKind so that callers can decide between retrying,
 * failing a container, or silently dropping an event.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace node_agent {

// ─────────────────────────────────────────────
// Error classification
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Configuration,   ///< Invalid task definition; never retried
    Transient,       ///< Temporary runtime or daemon failure
    Timeout,         ///< Operation exceeded its deadline
    Terminal,        ///< Runtime failure that will not succeed on retry
    Cancelled,       ///< Caller requested shutdown
    NotFound,        ///< Referenced entity does not exist
    ShouldNotSend,   ///< Event intentionally filtered from the backend
    Internal         ///< Agent-side failure (I/O, encoding)
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Transient:     return "transient";
        case ErrorKind::Timeout:       return "timeout";
        case ErrorKind::Terminal:      return "terminal";
        case ErrorKind::Cancelled:     return "cancelled";
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::ShouldNotSend: return "should_not_send";
        case ErrorKind::Internal:      return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    std::string message;
    ErrorKind kind{ErrorKind::Internal};

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : message(std::move(msg)), kind(k) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// Transient and timeout failures may succeed when attempted again.
    [[nodiscard]] bool retryable() const noexcept {
        return kind == ErrorKind::Transient || kind == ErrorKind::Timeout;
    }
};

/**
 * @brief Result<T, E>: holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for operations with no success value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace node_agent
