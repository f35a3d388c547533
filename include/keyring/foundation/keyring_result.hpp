#pragma once

/// @file keyring_result.hpp
/// @brief KeyringResult<T> type alias for key rotation error handling.

#include "keyring/core/result.hpp"
#include "keyring/foundation/keyring_error.hpp"

namespace keyring::foundation {

/// Result type specialized with KeyringError.
///
/// Example:
/// @code
///   KeyringResult<std::size_t> retainedLimit(int configured) {
///       if (configured < 2) {
///           return KeyringResult<std::size_t>::err(
///               KeyringError(ErrorCode::InvalidConfig, "need room for active + standby"));
///       }
///       return KeyringResult<std::size_t>::ok(static_cast<std::size_t>(configured));
///   }
/// @endcode
template <typename T>
using KeyringResult = keyring::Result<T, KeyringError>;

}  // namespace keyring::foundation
