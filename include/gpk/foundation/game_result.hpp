#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used across the gameplay kit.

#include "gpk/core/result.hpp"
#include "gpk/foundation/game_error.hpp"

namespace gpk::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<float> sampleDuration(float lo, float hi) {
///       if (hi < 0.0f) {
///           return GameResult<float>::err(
///               GameError(ErrorCode::InvalidArgument, "negative bound"));
///       }
///       return GameResult<float>::ok(lo);
///   }
/// @endcode
template <typename T>
using GameResult = gpk::Result<T, GameError>;

}  // namespace gpk::foundation
