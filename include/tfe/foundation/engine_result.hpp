#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> alias for engine error handling.

#include "tfe/core/result.hpp"
#include "tfe/foundation/engine_error.hpp"

namespace tfe::foundation {

/// Result type specialized with EngineError.
///
/// Example:
/// @code
///   EngineResult<int> parseRank(std::string_view text) {
///       int rank = 0;
///       auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), rank);
///       if (ec != std::errc{} || rank <= 0) {
///           return EngineResult<int>::err(
///               EngineError(ErrorCode::InvalidRank, "bad rank"));
///       }
///       return EngineResult<int>::ok(rank);
///   }
/// @endcode
template <typename T>
using EngineResult = tfe::Result<T, EngineError>;

}  // namespace tfe::foundation
