#pragma once

/// @file token_validator.hpp
/// @brief RS256 JWT verification against the eligible key set.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_store.hpp"
#include "keyring/rotation/rotation_events.hpp"
#include "keyring/token/claims.hpp"

namespace keyring::token {

using foundation::KeyringResult;

/// Why a token was rejected.
enum class ValidationFailureReason : uint8_t {
    Malformed,             ///< Not three Base64URL segments of valid JSON.
    UnsupportedAlgorithm,  ///< Header "alg" is anything but RS256 (including "none").
    SignatureInvalid,      ///< No eligible key verified the signature.
    Expired,               ///< Signature verified, but now >= "exp".
    NotBootstrapped        ///< No active key yet; a startup-ordering defect.
};

constexpr std::string_view validationFailureReasonName(ValidationFailureReason reason) {
    switch (reason) {
        case ValidationFailureReason::Malformed:            return "malformed";
        case ValidationFailureReason::UnsupportedAlgorithm: return "unsupported_algorithm";
        case ValidationFailureReason::SignatureInvalid:     return "signature_invalid";
        case ValidationFailureReason::Expired:              return "expired";
        case ValidationFailureReason::NotBootstrapped:      return "not_bootstrapped";
    }
    return "unknown";
}

/// Typed failure attached as context to the KeyringError of a rejected token.
///
/// @code
///   auto result = validator.validate(token);
///   if (!result) {
///       if (const auto* f = result.error().context<ValidationFailure>()) {
///           if (f->reason == ValidationFailureReason::Expired) { ... }
///       }
///   }
/// @endcode
struct ValidationFailure {
    ValidationFailureReason reason = ValidationFailureReason::Malformed;
    std::optional<std::string> keyId;  ///< Verifying key (Expired) or header kid.
    std::size_t keysTried = 0;
};

/// A token whose signature verified.
struct VerifiedToken {
    std::string keyId;  ///< Key that verified the signature.
    Claims claims;
};

/// Verifies compact RS256 JWS tokens.
///
/// Takes one eligible-set snapshot per call and tries the key named by the
/// header "kid" first, then the remaining eligible keys. Never throws.
class TokenValidator {
public:
    explicit TokenValidator(std::shared_ptr<const keys::IKeyView> keys,
                            std::shared_ptr<const foundation::Clock> clock = nullptr,
                            std::shared_ptr<rotation::IRotationEventSink> events = nullptr);

    /// Verify @p token.
    ///
    /// Errors (with ValidationFailure context): MalformedToken,
    /// UnsupportedAlgorithm, SignatureInvalid, TokenExpired, NoActiveKey.
    [[nodiscard]] KeyringResult<VerifiedToken> validate(std::string_view token,
                                                        bool checkExpiry = true) const;

private:
    std::shared_ptr<const keys::IKeyView> keys_;
    std::shared_ptr<const foundation::Clock> clock_;
    std::shared_ptr<rotation::IRotationEventSink> events_;
};

}  // namespace keyring::token
