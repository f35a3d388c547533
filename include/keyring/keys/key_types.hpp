#pragma once

/// @file key_types.hpp
/// @brief Key record and the read-only views handed to token consumers.
///
/// A KeyRecord carries private material and lives only inside the KeyStore.
/// Consumers receive either a SigningKey (the issuer, active key only) or a
/// VerificationKey (validator and exporter, public material only).

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "keyring/foundation/clock.hpp"

namespace keyring::keys {

using foundation::TimePoint;

/// Signing algorithm tag written to the JWT header and JWK "alg".
inline constexpr std::string_view kAlgorithmRs256 = "RS256";

/// Lifecycle state of a key. Transitions only move forward.
enum class KeyState : uint8_t {
    Standby,   ///< Generated, not yet signing.
    Active,    ///< The single key that signs new tokens.
    Retiring,  ///< Superseded; still verifies until expiresAt + grace.
    Expired    ///< Past its window; removed on the next sweep.
};

/// Return the string name for a key state.
constexpr std::string_view keyStateName(KeyState state) {
    switch (state) {
        case KeyState::Standby:  return "standby";
        case KeyState::Active:   return "active";
        case KeyState::Retiring: return "retiring";
        case KeyState::Expired:  return "expired";
    }
    return "unknown";
}

/// One generated RSA key pair and its lifecycle metadata.
struct KeyRecord {
    std::string keyId;
    std::string privateKeyPem;  ///< Wiped when the key leaves Active.
    std::string publicKeyPem;
    std::string algorithm{kAlgorithmRs256};
    uint32_t keyBits = 0;
    TimePoint createdAt{};
    std::optional<TimePoint> activatedAt;
    KeyState state = KeyState::Standby;
    std::optional<TimePoint> retiringSince;
    std::optional<TimePoint> expiresAt;  ///< retiringSince + overlap.
};

/// The active key as seen by the token issuer.
struct SigningKey {
    std::string keyId;
    std::string privateKeyPem;
    std::string algorithm;
};

/// Public half of an eligible key as seen by the validator and exporter.
struct VerificationKey {
    std::string keyId;
    std::string publicKeyPem;
    std::string algorithm;
    KeyState state = KeyState::Active;
    TimePoint createdAt{};
    std::optional<TimePoint> activatedAt;
    std::optional<TimePoint> expiresAt;
};

/// Introspection record for health reporting. Carries no key material.
struct KeyMetadata {
    std::string keyId;
    std::string algorithm;
    uint32_t keyBits = 0;
    KeyState state = KeyState::Standby;
    TimePoint createdAt{};
    std::optional<TimePoint> activatedAt;
    std::optional<TimePoint> retiringSince;
    std::optional<TimePoint> expiresAt;
};

/// Strip a record down to its metadata.
[[nodiscard]] inline KeyMetadata toMetadata(const KeyRecord& record) {
    return KeyMetadata{record.keyId,
                       record.algorithm,
                       record.keyBits,
                       record.state,
                       record.createdAt,
                       record.activatedAt,
                       record.retiringSince,
                       record.expiresAt};
}

}  // namespace keyring::keys
