/**
 * @file result.hpp
 * @brief Monadic error handling type for PrintScheduler.
 *
 * Result<T, E> is the primary error-handling mechanism of the engine: every
 * fallible operation returns either a value or an Error that carries an
 * ErrorKind, so callers can tell a per-batch failure (local, non-fatal) from
 * a configuration or structural failure (fatal to the run).
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

namespace print_scheduler {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Generic,
    UnroutableJob,       ///< Job has no compatible printer
    BatchInfeasible,     ///< Solver proved infeasibility or ran out of budget
    DegenerateHorizon,   ///< Zero estimated work; normally substituted, not raised
    Configuration,       ///< Invalid caller-supplied configuration
    EmptyRoster,         ///< No printers to schedule on
    Io,                  ///< File could not be opened, read or written
    Parse                ///< Malformed input data
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:           return "generic";
        case ErrorKind::UnroutableJob:     return "unroutable_job";
        case ErrorKind::BatchInfeasible:   return "batch_infeasible";
        case ErrorKind::DegenerateHorizon: return "degenerate_horizon";
        case ErrorKind::Configuration:     return "configuration";
        case ErrorKind::EmptyRoster:       return "empty_roster";
        case ErrorKind::Io:                return "io";
        case ErrorKind::Parse:             return "parse";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind and a descriptive message.
 */
struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }

    /// True for errors that must abort the whole run rather than one batch.
    [[nodiscard]] constexpr bool is_fatal() const noexcept {
        return kind != ErrorKind::BatchInfeasible && kind != ErrorKind::DegenerateHorizon;
    }
};

/**
 * @brief Result<T, E>: holds either a success value of type T or an error E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + error().message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(*this).value(); }
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
        if (has_value()) return func(value());
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) return func(value());
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
 * @brief Result for operations that can fail but return nothing on success.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

template <typename T, typename E = Error>
Result<T, E> make_error(ErrorKind kind, std::string message) {
    return Result<T, E>(E{kind, std::move(message)});
}

}  // namespace print_scheduler
