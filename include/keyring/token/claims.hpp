#pragma once

/// @file claims.hpp
/// @brief JWT claim set representation.
///
/// Claims are a flat JSON object. Values are limited to the JSON types
/// tokens carry in practice: null, booleans, integers, floating-point
/// numbers, strings and arrays of strings (e.g. "aud", "roles").

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keyring::token {

/// One claim value.
using ClaimValue = std::variant<std::nullptr_t,
                                bool,
                                int64_t,
                                double,
                                std::string,
                                std::vector<std::string>>;

/// Claim set keyed by claim name. Ordered so encoding is deterministic.
using Claims = std::map<std::string, ClaimValue, std::less<>>;

/// Registered claim names (RFC 7519 §4.1).
namespace claim {
inline constexpr std::string_view kIssuer = "iss";
inline constexpr std::string_view kSubject = "sub";
inline constexpr std::string_view kAudience = "aud";
inline constexpr std::string_view kExpiresAt = "exp";
inline constexpr std::string_view kIssuedAt = "iat";
inline constexpr std::string_view kJwtId = "jti";
}  // namespace claim

/// Integer value of a claim, or nullopt if absent or not an integer.
[[nodiscard]] inline std::optional<int64_t> claimInt(const Claims& claims, std::string_view name) {
    auto it = claims.find(name);
    if (it == claims.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<int64_t>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

/// String value of a claim, or nullopt if absent or not a string.
[[nodiscard]] inline std::optional<std::string> claimString(const Claims& claims,
                                                            std::string_view name) {
    auto it = claims.find(name);
    if (it == claims.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

}  // namespace keyring::token
