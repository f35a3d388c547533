/// @file token_validator.cpp
/// @brief TokenValidator implementation.

#include "keyring/token/token_validator.hpp"

#include "crypto/crypto_utils.hpp"
#include "crypto/rsa_utils.hpp"
#include "json_codec.hpp"
#include "keyring/foundation/keyring_logger.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace keyring::token {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::KeyringLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using rotation::RotationEvent;

namespace {

struct TokenParts {
    std::string_view signingInput;  // header.payload
    std::string_view header;
    std::string_view payload;
    std::string_view signature;
};

std::optional<TokenParts> splitToken(std::string_view token) {
    auto first = token.find('.');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = token.find('.', first + 1);
    if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    TokenParts parts;
    parts.signingInput = token.substr(0, second);
    parts.header = token.substr(0, first);
    parts.payload = token.substr(first + 1, second - first - 1);
    parts.signature = token.substr(second + 1);
    if (parts.header.empty() || parts.payload.empty() || parts.signature.empty()) {
        return std::nullopt;
    }
    return parts;
}

KeyringResult<VerifiedToken> reject(ErrorCode code,
                                    std::string message,
                                    ValidationFailureReason reason,
                                    std::optional<std::string> keyId = std::nullopt,
                                    std::size_t keysTried = 0) {
    return KeyringResult<VerifiedToken>::err(KeyringError(
        code, std::move(message), ValidationFailure{reason, std::move(keyId), keysTried}));
}

}  // namespace

TokenValidator::TokenValidator(std::shared_ptr<const keys::IKeyView> keys,
                               std::shared_ptr<const foundation::Clock> clock,
                               std::shared_ptr<rotation::IRotationEventSink> events)
    : keys_(std::move(keys)),
      clock_(clock ? std::move(clock) : foundation::systemClock()),
      events_(events ? std::move(events) : std::make_shared<rotation::NullEventSink>()) {}

KeyringResult<VerifiedToken> TokenValidator::validate(std::string_view token,
                                                      bool checkExpiry) const {
    auto eligible = keys_->getEligibleForValidation();
    if (!eligible) {
        return reject(ErrorCode::NoActiveKey,
                      std::string(eligible.error().message()),
                      ValidationFailureReason::NotBootstrapped);
    }

    auto malformed = [this](std::string message) {
        events_->record(RotationEvent::ValidationMalformed, {});
        return reject(ErrorCode::MalformedToken, std::move(message),
                      ValidationFailureReason::Malformed);
    };

    auto parts = splitToken(token);
    if (!parts) {
        return malformed("token is not three dot-separated segments");
    }

    auto headerJson = crypto::base64urlDecodeString(parts->header);
    auto payloadJson = crypto::base64urlDecodeString(parts->payload);
    auto signature = crypto::base64urlDecode(parts->signature);
    if (!headerJson || !payloadJson || !signature) {
        return malformed("token segment is not valid base64url");
    }

    auto header = detail::decodeClaims(*headerJson);
    auto claims = detail::decodeClaims(*payloadJson);
    if (!header || !claims) {
        return malformed("token segment is not a valid JSON object");
    }

    auto alg = claimString(*header, "alg");
    if (!alg) {
        return malformed("header has no \"alg\"");
    }
    if (*alg != keys::kAlgorithmRs256) {
        events_->record(RotationEvent::ValidationMalformed, {});
        return reject(ErrorCode::UnsupportedAlgorithm, "algorithm not accepted: " + *alg,
                      ValidationFailureReason::UnsupportedAlgorithm);
    }
    auto kid = claimString(*header, "kid");

    // kid match first; the rest keep their eligible-set order.
    auto& candidates = eligible.value();
    if (kid) {
        std::stable_partition(candidates.begin(), candidates.end(),
                              [&kid](const keys::VerificationKey& k) { return k.keyId == *kid; });
    }

    std::size_t tried = 0;
    const keys::VerificationKey* verifiedBy = nullptr;
    for (const auto& candidate : candidates) {
        ++tried;
        if (crypto::rsaSha256Verify(candidate.publicKeyPem, parts->signingInput, *signature)) {
            verifiedBy = &candidate;
            break;
        }
    }

    if (verifiedBy == nullptr) {
        events_->record(RotationEvent::ValidationSignatureInvalid, kid.value_or(std::string{}));
        LogContext ctx;
        ctx.keyId = kid;
        ctx.extra["keys_tried"] = std::to_string(tried);
        KeyringLogger::instance().logWithContext(LogLevel::Debug, LogCategory::Token,
                                                 "No eligible key verified token", ctx);
        return reject(ErrorCode::SignatureInvalid, "signature invalid for all eligible keys",
                      ValidationFailureReason::SignatureInvalid, kid, tried);
    }

    if (checkExpiry) {
        auto exp = claimInt(*claims, claim::kExpiresAt);
        if (!exp) {
            return malformed("token has no integer \"exp\" claim");
        }
        if (foundation::toEpochSeconds(clock_->now()) >= *exp) {
            events_->record(RotationEvent::ValidationExpired, verifiedBy->keyId);
            return reject(ErrorCode::TokenExpired, "token expired",
                          ValidationFailureReason::Expired, verifiedBy->keyId, tried);
        }
    }

    events_->record(RotationEvent::ValidationSucceeded, verifiedBy->keyId);
    return KeyringResult<VerifiedToken>::ok(VerifiedToken{verifiedBy->keyId, std::move(*claims)});
}

}  // namespace keyring::token
