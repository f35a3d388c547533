/// @file token_issuer.cpp
/// @brief TokenIssuer implementation.

#include "keyring/token/token_issuer.hpp"

#include "crypto/crypto_utils.hpp"
#include "crypto/rsa_utils.hpp"
#include "json_codec.hpp"
#include "keyring/foundation/keyring_logger.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace keyring::token {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::LogCategory;
using rotation::RotationEvent;

TokenIssuer::TokenIssuer(std::shared_ptr<const keys::IKeyView> keys,
                         std::shared_ptr<const foundation::Clock> clock,
                         std::string issuer,
                         std::shared_ptr<rotation::IRotationEventSink> events)
    : keys_(std::move(keys)),
      clock_(clock ? std::move(clock) : foundation::systemClock()),
      issuer_(std::move(issuer)),
      events_(events ? std::move(events) : std::make_shared<rotation::NullEventSink>()) {}

KeyringResult<std::string> TokenIssuer::issue(Claims claims,
                                              std::chrono::seconds lifetime) const {
    if (lifetime.count() <= 0) {
        return KeyringResult<std::string>::err(
            KeyringError(ErrorCode::InvalidArgument, "token lifetime must be positive"));
    }
    const auto iat = foundation::toEpochSeconds(clock_->now());
    if (lifetime.count() > std::numeric_limits<int64_t>::max() - std::max<int64_t>(iat, 0)) {
        return KeyringResult<std::string>::err(
            KeyringError(ErrorCode::InvalidArgument, "token lifetime overflows the exp claim"));
    }

    auto active = keys_->getActive();
    if (!active) {
        events_->record(RotationEvent::TokenIssueFailed, {});
        return KeyringResult<std::string>::err(active.error());
    }
    const auto& key = active.value();

    claims[std::string(claim::kIssuedAt)] = iat;
    claims[std::string(claim::kExpiresAt)] = iat + static_cast<int64_t>(lifetime.count());

    if (claims.find(claim::kJwtId) == claims.end()) {
        auto jti = crypto::secureRandomHex(16);
        if (!jti) {
            events_->record(RotationEvent::TokenIssueFailed, key.keyId);
            return KeyringResult<std::string>::err(
                KeyringError(ErrorCode::RandomnessUnavailable, "RAND_bytes failed for jti"));
        }
        claims.emplace(std::string(claim::kJwtId), std::move(*jti));
    }
    if (!issuer_.empty() && claims.find(claim::kIssuer) == claims.end()) {
        claims.emplace(std::string(claim::kIssuer), issuer_);
    }

    std::string header = "{\"alg\":" + detail::jsonQuote(key.algorithm) +
                         ",\"kid\":" + detail::jsonQuote(key.keyId) + ",\"typ\":\"JWT\"}";

    std::string signingInput = crypto::base64urlEncode(header);
    signingInput.push_back('.');
    signingInput += crypto::base64urlEncode(detail::encodeClaims(claims));

    auto signature = crypto::rsaSha256Sign(key.privateKeyPem, signingInput);
    if (signature.empty()) {
        events_->record(RotationEvent::TokenIssueFailed, key.keyId);
        KEYRING_LOG_ERROR(LogCategory::Token, "RS256 signing failed for key " + key.keyId);
        return KeyringResult<std::string>::err(
            KeyringError(ErrorCode::SigningFailed, "RS256 signing failed"));
    }

    signingInput.push_back('.');
    signingInput += crypto::base64urlEncode(signature.data(), signature.size());

    events_->record(RotationEvent::TokenIssued, key.keyId);
    return KeyringResult<std::string>::ok(std::move(signingInput));
}

}  // namespace keyring::token
