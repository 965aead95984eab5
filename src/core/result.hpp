/**
 * @file result.hpp
 * @brief Error handling vocabulary for TierGate.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> carries recoverable failures (configuration, request parsing)
 * as values. OrchestrationFault is the one exception the run path raises:
 * it signals a bug in the scheduler's own bookkeeping, never a validator
 * failure, and is what triggers the sequential fallback.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace tier_gate {

/**
 * @brief Error type carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Raised when the concurrent orchestration itself breaks.
 */
class OrchestrationFault : public std::runtime_error {
public:
    explicit OrchestrationFault(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Holds either a success value of type T or an error of type E.
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
        if (!has_value()) throw std::logic_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result has no value: " + error().message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return std::get<T>(storage_);
        return fallback;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success payload.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

}  // namespace tier_gate
