#pragma once

/// @file json_codec.hpp
/// @brief Minimal JSON encoding/decoding for flat JWT objects.
///
/// Internal to the token module. Handles exactly what JWT headers, claim
/// sets and JWK members need; nested objects are rejected.

#include <optional>
#include <string>
#include <string_view>

#include "keyring/token/claims.hpp"

namespace keyring::token::detail {

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string jsonQuote(std::string_view value);

/// Encode one claim value.
[[nodiscard]] std::string encodeClaimValue(const ClaimValue& value);

/// Encode a claim set as a compact JSON object, members in key order.
[[nodiscard]] std::string encodeClaims(const Claims& claims);

/// Decode a flat JSON object. Returns nullopt on syntax errors, duplicate
/// member names, nested objects, non-string array elements, or trailing data.
[[nodiscard]] std::optional<Claims> decodeClaims(std::string_view json);

}  // namespace keyring::token::detail
