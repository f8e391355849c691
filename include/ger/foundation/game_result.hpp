#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every fallible registry operation.

#include "ger/core/result.hpp"
#include "ger/foundation/game_error.hpp"

namespace ger::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int32_t> checkedLevel(int32_t level) {
///       if (level < 1) {
///           return GameResult<int32_t>::err(
///               GameError(ErrorCode::InvalidArgument, "level must be >= 1"));
///       }
///       return GameResult<int32_t>::ok(level);
///   }
/// @endcode
template <typename T>
using GameResult = ger::Result<T, GameError>;

}  // namespace ger::foundation
