#pragma once

/// @file duel_result.hpp
/// @brief DuelResult<T> alias binding Result to DuelError.

#include "duel/core/result.hpp"
#include "duel/foundation/duel_error.hpp"

namespace duel::foundation {

/// Result type used by every fallible engine operation.
///
/// Example:
/// @code
///   DuelResult<int32_t> parseLevel(int32_t raw) {
///       if (raw < 1) {
///           return DuelResult<int32_t>::err(
///               DuelError(ErrorCode::InvalidArgument, "level must be >= 1"));
///       }
///       return DuelResult<int32_t>::ok(raw);
///   }
/// @endcode
template <typename T>
using DuelResult = duel::Result<T, DuelError>;

} // namespace duel::foundation
