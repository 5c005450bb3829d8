/**
 * @file result.hpp
 * @brief Value-or-error return type used by every fallible kube_balance call.
 *
 * Collaborator failures (list/get/patch/evict), malformed input and
 * configuration problems are all reported through Result<T, E> rather than
 * exceptions, so the reconcile loop can decide per call whether a failure
 * aborts the cycle, skips a step or is merely logged.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace kube_balance {

/**
 * @brief Generic error carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
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
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::logic_error("Result holds an error");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value");
        return std::get<E>(storage_);
    }

    /// Transform the success value, passing errors through untouched.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return func(value());
        return error();
    }

    /// Transform the error, passing the success value through untouched.
    template <typename F>
    auto map_error(F&& func) const -> Result<T, std::invoke_result_t<F, const E&>> {
        if (has_value()) return value();
        return func(error());
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return value();
        return fallback;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that succeed without producing a value.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value");
        return *error_;
    }

private:
    std::optional<E> error_;
};

}  // namespace kube_balance
