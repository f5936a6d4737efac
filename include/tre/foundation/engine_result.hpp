#pragma once

/// @file engine_result.hpp
/// @brief EngineResult<T> type alias for rating engine error handling.

#include "tre/core/result.hpp"
#include "tre/foundation/engine_error.hpp"

namespace tre::foundation {

/// Result type specialized with EngineError.
///
/// Every operation that can fail (config loading, splitting, feed reading,
/// export) returns EngineResult<T> instead of throwing.
///
/// Example:
/// @code
///   EngineResult<double> weightFor(Tier tier) const {
///       auto it = weights_.find(tier);
///       if (it == weights_.end()) {
///           return EngineResult<double>::err(
///               EngineError(ErrorCode::UnknownTier, "no weight for tier"));
///       }
///       return EngineResult<double>::ok(it->second);
///   }
/// @endcode
template <typename T>
using EngineResult = tre::Result<T, EngineError>;

}  // namespace tre::foundation
