#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for core error handling.

#include "dai/core/result.hpp"
#include "dai/foundation/game_error.hpp"

namespace dai::foundation {

/// Result type specialized with GameError.
///
/// Validation and configuration operations return GameResult<T> instead of
/// throwing. Expected lookup misses (no cell, no path) use std::optional.
///
/// Example:
/// @code
///   GameResult<float> readOpenTime(const ConfigManager& config) {
///       auto value = config.get<float>("ai.turret.open_time");
///       if (value.hasValue() && value.value() <= 0.0f) {
///           return GameResult<float>::err(
///               GameError(ErrorCode::InvalidArgument, "open time must be positive"));
///       }
///       return value;
///   }
/// @endcode
template <typename T>
using GameResult = dai::Result<T, GameError>;

}  // namespace dai::foundation
