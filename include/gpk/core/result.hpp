#pragma once

/// @file result.hpp
/// @brief Result<T, E> for explicit error propagation without exceptions.

#include <utility>
#include <variant>

namespace gpk {

/// Holds either a success value of type T or an error of type E.
///
/// Gameplay code never throws across component boundaries; operations
/// that can fail hand back a Result and the caller decides whether to
/// log, degrade, or propagate.
///
/// Example:
/// @code
///   auto scene = loadSceneFile("level01.yaml");
///   if (!scene) {
///       log(scene.error().message());
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Access value or return a fallback.
    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace gpk
