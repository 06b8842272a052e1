#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError>.

#include <string>
#include <string_view>
#include <utility>

#include "gpk/foundation/error_code.hpp"

namespace gpk::foundation {

/// Error carrying a categorized code, a message and, optionally, the
/// place it came from (a scene key path such as "entities[2].tag", or an
/// entity name).
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::string source)
        : code_(code), message_(std::move(message)), source_(std::move(source)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Empty when the error is not tied to a location.
    [[nodiscard]] std::string_view source() const noexcept { return source_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// "source: message", or just the message when there is no source.
    [[nodiscard]] std::string describe() const {
        return source_.empty() ? message_ : source_ + ": " + message_;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::string source_;
};

} // namespace gpk::foundation
