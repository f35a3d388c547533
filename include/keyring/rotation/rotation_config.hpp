#pragma once

/// @file rotation_config.hpp
/// @brief Process-lifetime configuration of the rotation subsystem.
///
/// Read once at startup from the "keyring" section of the YAML config:
/// @code
///   keyring:
///     rotation_interval_seconds: 604800
///     overlap_seconds: 86400
///     key_size_bits: 2048
///     max_retained_keys: 5
///     pregenerate_next_key: true
///     validation_grace_seconds: 300
///     max_poll_interval_ms: 60000
///     default_token_lifetime_seconds: 900
///     issuer: "keyring"
/// @endcode

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "keyring/foundation/config_manager.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_store.hpp"

namespace keyring::rotation {

using foundation::KeyringResult;

/// Smallest modulus accepted at all.
inline constexpr uint32_t kMinKeySizeBits = 1024;

/// Smallest modulus accepted without a warning.
inline constexpr uint32_t kRecommendedKeySizeBits = 2048;

/// Rotation schedule, retention and issuance settings.
struct RotationConfig {
    /// Time an Active key signs before the scheduler replaces it.
    std::chrono::seconds rotationInterval{std::chrono::hours(24 * 7)};

    /// Time a demoted key keeps verifying.
    std::chrono::seconds overlapDuration{std::chrono::hours(24)};

    /// RSA modulus size for generated keys.
    uint32_t keySizeBits = kRecommendedKeySizeBits;

    /// Upper bound on keys held after a sweep (active + standby + retiring).
    std::size_t maxRetainedKeys = 5;

    /// Generate the next standby right after each promotion.
    bool preGenerateNextKey = true;

    /// Clock-skew allowance on top of the overlap.
    std::chrono::seconds validationGracePeriod{std::chrono::minutes(5)};

    /// Longest the scheduler sleeps before re-evaluating.
    std::chrono::milliseconds maxPollInterval{std::chrono::seconds(60)};

    /// Lifetime used by KeyringService::issue(claims).
    std::chrono::seconds defaultTokenLifetime{std::chrono::minutes(15)};

    /// Value of the "iss" claim; empty means the claim is not added.
    std::string issuer;

    /// Store retention rules derived from this config.
    [[nodiscard]] keys::KeyStorePolicy storePolicy() const {
        return keys::KeyStorePolicy{overlapDuration, validationGracePeriod, maxRetainedKeys};
    }
};

/// Build a RotationConfig from the "keyring.*" keys, defaulting any key that
/// is absent.
///
/// Errors: ConfigTypeMismatch if a present key has the wrong type,
/// InvalidConfig if the result fails validateRotationConfig.
[[nodiscard]] KeyringResult<RotationConfig> loadRotationConfig(
    const foundation::ConfigManager& config);

/// Check a config for values the subsystem cannot run with.
///
/// @return Non-fatal warnings on success; InvalidConfig naming the first
///         offending field otherwise.
[[nodiscard]] KeyringResult<std::vector<std::string>> validateRotationConfig(
    const RotationConfig& config);

}  // namespace keyring::rotation
