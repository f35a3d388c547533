#pragma once

/// @file token_issuer.hpp
/// @brief RS256 JWT signing with the current active key.

#include <chrono>
#include <memory>
#include <string>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_store.hpp"
#include "keyring/rotation/rotation_events.hpp"
#include "keyring/token/claims.hpp"

namespace keyring::token {

using foundation::KeyringResult;

/// Signs claim sets as compact JWS tokens.
///
/// Reads the active key exactly once per token, so a token issued after a
/// promotion completes is always signed by the new key. Never sees standby
/// or retiring keys.
///
/// Header: {"alg":"RS256","kid":"<active key id>","typ":"JWT"}.
/// Added claims: "iat", "exp" (always overwritten), "jti" (random, only if
/// absent), "iss" (only if an issuer is configured and the caller did not
/// set one).
class TokenIssuer {
public:
    TokenIssuer(std::shared_ptr<const keys::IKeyView> keys,
                std::shared_ptr<const foundation::Clock> clock = nullptr,
                std::string issuer = {},
                std::shared_ptr<rotation::IRotationEventSink> events = nullptr);

    /// Sign @p claims with a token lifetime of @p lifetime.
    ///
    /// Errors: InvalidArgument (lifetime <= 0), NoActiveKey (before
    /// bootstrap), SigningFailed, RandomnessUnavailable (jti).
    [[nodiscard]] KeyringResult<std::string> issue(Claims claims,
                                                   std::chrono::seconds lifetime) const;

private:
    std::shared_ptr<const keys::IKeyView> keys_;
    std::shared_ptr<const foundation::Clock> clock_;
    std::string issuer_;
    std::shared_ptr<rotation::IRotationEventSink> events_;
};

}  // namespace keyring::token
