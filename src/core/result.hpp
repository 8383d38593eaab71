/**
 * @file result.hpp
 * @brief Value-or-error return type used at every module boundary.
 *
 * Operations that can fail return Result<T>: either the value or an Error
 * tagged with its ErrorKind. The kind is what callers branch on; the
 * message is for humans and logs.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sandbox_exec {

/**
 * @brief A failure: its place in the error taxonomy plus a message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    /// "kind: message", as printed by the CLI and the logs.
    [[nodiscard]] std::string describe() const {
        return std::string{to_string(kind)} + ": " + message;
    }
};

/**
 * @brief Raised by Result::value() when the Result holds an Error.
 */
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const Error& error)
        : std::logic_error("Result holds an error (" + error.describe() + ")")
        , kind_(error.kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    // ── Value access (throws BadResultAccess on error) ──

    [[nodiscard]] T& value() & {
        check();
        return std::get<0>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        check();
        return std::get<0>(storage_);
    }
    [[nodiscard]] T&& value() && {
        check();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] T value_or(T fallback) const& {
        return has_value() ? std::get<0>(storage_) : std::move(fallback);
    }

    // ── Error access (precondition: !has_value()) ──

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(storage_);
    }

    /// Apply @p func to the value; an error passes through unchanged.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (!has_value()) return std::get<1>(storage_);
        return std::forward<F>(func)(std::get<0>(storage_));
    }

private:
    void check() const {
        if (has_value()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw BadResultAccess(std::get<1>(storage_));
        } else {
            throw std::logic_error("Result holds an error");
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Success-or-error for operations with nothing to return.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }
    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

template <typename T>
Result<T> make_error(ErrorKind kind, std::string message) {
    return Result<T>(Error{kind, std::move(message)});
}

}  // namespace sandbox_exec
