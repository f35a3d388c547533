#include <gtest/gtest.h>

#include "crypto/crypto_utils.hpp"
#include "crypto/rsa_utils.hpp"
#include "keyring/token/token_issuer.hpp"
#include "keyring/token/token_validator.hpp"
#include "support/bootstrapped_store.hpp"
#include "support/recording_event_sink.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace keyring::token;
using namespace std::chrono_literals;
using keyring::foundation::ErrorCode;
using keyring::keys::KeyStorePolicy;
using keyring::rotation::RotationEvent;
using keyring::test_support::BootstrappedStore;
using keyring::test_support::kDefaultStartEpoch;
using keyring::test_support::RecordingEventSink;

namespace {

/// Build a compact token from raw header and payload JSON, signed with
/// @p privateKeyPem (or with an empty signature segment if it is empty).
std::string forgeToken(const std::string& headerJson, const std::string& payloadJson,
                       const std::string& privateKeyPem) {
    std::string token = keyring::crypto::base64urlEncode(headerJson);
    token.push_back('.');
    token += keyring::crypto::base64urlEncode(payloadJson);
    auto signature = keyring::crypto::rsaSha256Sign(privateKeyPem, token);
    token.push_back('.');
    token += keyring::crypto::base64urlEncode(signature.data(), signature.size());
    return token;
}

const ValidationFailure* failureOf(const keyring::foundation::KeyringError& error) {
    return error.context<ValidationFailure>();
}

}  // namespace

class TokenValidatorTest : public ::testing::Test {
protected:
    void SetUp() override { firstKey_ = keys_.rotate(); }

    std::string issue(std::chrono::seconds lifetime = 60s) {
        auto token = issuer_.issue({}, lifetime);
        EXPECT_TRUE(token.hasValue());
        return token ? token.value() : std::string{};
    }

    std::string activePrivatePem() const {
        return keys_.store->getActive().value().privateKeyPem;
    }

    BootstrappedStore keys_{KeyStorePolicy{24h, 5min, 5}};
    std::shared_ptr<RecordingEventSink> events_ = std::make_shared<RecordingEventSink>();
    TokenIssuer issuer_{keys_.store, keys_.clock};
    TokenValidator validator_{keys_.store, keys_.clock, events_};
    std::string firstKey_;
};

// =============================================================================
// Accepted tokens
// =============================================================================

TEST_F(TokenValidatorTest, AcceptsFreshToken) {
    Claims claims;
    claims["sub"] = std::string("user-1");
    auto token = issuer_.issue(claims, 60s);
    ASSERT_TRUE(token.hasValue());

    auto result = validator_.validate(token.value());
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().keyId, firstKey_);
    EXPECT_EQ(claimString(result.value().claims, "sub"), "user-1");
    EXPECT_EQ(claimInt(result.value().claims, "exp"), kDefaultStartEpoch + 60);
    EXPECT_EQ(events_->count(RotationEvent::ValidationSucceeded), 1u);
}

TEST_F(TokenValidatorTest, AcceptsTokenFromRetiringKey) {
    auto token = issue(48h);
    const auto second = keys_.rotate();

    auto result = validator_.validate(token);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().keyId, firstKey_);
    EXPECT_NE(result.value().keyId, second);
}

TEST_F(TokenValidatorTest, UnknownKidFallsBackToEligibleKeys) {
    const std::string payload =
        "{\"exp\":" + std::to_string(kDefaultStartEpoch + 60) + ",\"sub\":\"x\"}";
    auto token = forgeToken(R"({"alg":"RS256","kid":"not-a-key","typ":"JWT"})", payload,
                            activePrivatePem());
    auto result = validator_.validate(token);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().keyId, firstKey_);
}

TEST_F(TokenValidatorTest, MissingKidStillVerifies) {
    const std::string payload = "{\"exp\":" + std::to_string(kDefaultStartEpoch + 60) + "}";
    auto token = forgeToken(R"({"alg":"RS256"})", payload, activePrivatePem());
    EXPECT_TRUE(validator_.validate(token).hasValue());
}

// =============================================================================
// Rejected tokens
// =============================================================================

TEST_F(TokenValidatorTest, RejectsMalformedTokens) {
    for (const char* token : {"", "abc", "a.b", "a.b.c.d", ".b.c", "a..c", "a.b.",
                              "!!!.???.***", "e30.e30.AAAA"}) {
        auto result = validator_.validate(token);
        ASSERT_TRUE(result.hasError()) << token;
        EXPECT_EQ(result.error().code(), ErrorCode::MalformedToken) << token;
        const auto* failure = failureOf(result.error());
        ASSERT_NE(failure, nullptr);
        EXPECT_EQ(failure->reason, ValidationFailureReason::Malformed);
    }
    EXPECT_GE(events_->count(RotationEvent::ValidationMalformed), 9u);
}

TEST_F(TokenValidatorTest, RejectsNonJsonSegments) {
    std::string token = keyring::crypto::base64urlEncode("not json");
    token += "." + keyring::crypto::base64urlEncode("{}") + ".AAAA";
    EXPECT_EQ(validator_.validate(token).error().code(), ErrorCode::MalformedToken);
}

TEST_F(TokenValidatorTest, RejectsAlgNone) {
    std::string token = keyring::crypto::base64urlEncode(R"({"alg":"none","typ":"JWT"})");
    token += "." + keyring::crypto::base64urlEncode(R"({"sub":"admin"})") + ".AAAA";
    auto result = validator_.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAlgorithm);
    EXPECT_EQ(failureOf(result.error())->reason, ValidationFailureReason::UnsupportedAlgorithm);
}

TEST_F(TokenValidatorTest, RejectsHmacAlgorithm) {
    const std::string payload = "{\"exp\":" + std::to_string(kDefaultStartEpoch + 60) + "}";
    auto token = forgeToken(R"({"alg":"HS256","typ":"JWT"})", payload, activePrivatePem());
    EXPECT_EQ(validator_.validate(token).error().code(), ErrorCode::UnsupportedAlgorithm);
}

TEST_F(TokenValidatorTest, RejectsTamperedPayload) {
    auto token = issue();
    auto first = token.find('.');
    auto second = token.find('.', first + 1);
    std::string forgedPayload = keyring::crypto::base64urlEncode(
        "{\"exp\":" + std::to_string(kDefaultStartEpoch + 60) + ",\"sub\":\"admin\"}");
    std::string tampered =
        token.substr(0, first + 1) + forgedPayload + token.substr(second);

    auto result = validator_.validate(tampered);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureInvalid);
    const auto* failure = failureOf(result.error());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->reason, ValidationFailureReason::SignatureInvalid);
    EXPECT_EQ(failure->keyId, firstKey_);
    EXPECT_EQ(failure->keysTried, 1u);
    EXPECT_EQ(events_->count(RotationEvent::ValidationSignatureInvalid), 1u);
}

TEST_F(TokenValidatorTest, RejectsForeignKey) {
    BootstrappedStore other;
    other.rotate();
    TokenIssuer foreignIssuer(other.store, keys_.clock);
    auto token = foreignIssuer.issue({}, 60s);
    ASSERT_TRUE(token.hasValue());

    keys_.rotate();
    auto result = validator_.validate(token.value());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureInvalid);
    EXPECT_EQ(failureOf(result.error())->keysTried, 2u);
}

TEST_F(TokenValidatorTest, RejectsExpiredToken) {
    auto token = issue(60s);
    keys_.clock->advance(59s);
    EXPECT_TRUE(validator_.validate(token).hasValue());

    keys_.clock->advance(1s);
    auto result = validator_.validate(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
    const auto* failure = failureOf(result.error());
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->reason, ValidationFailureReason::Expired);
    EXPECT_EQ(failure->keyId, firstKey_);
    EXPECT_EQ(events_->count(RotationEvent::ValidationExpired), 1u);
}

TEST_F(TokenValidatorTest, ExpiryCheckCanBeSkipped) {
    auto token = issue(60s);
    keys_.clock->advance(2h);
    EXPECT_EQ(validator_.validate(token).error().code(), ErrorCode::TokenExpired);
    EXPECT_TRUE(validator_.validate(token, false).hasValue());
}

TEST_F(TokenValidatorTest, MissingExpIsMalformed) {
    auto token = forgeToken(R"({"alg":"RS256"})", R"({"sub":"x"})", activePrivatePem());
    EXPECT_EQ(validator_.validate(token).error().code(), ErrorCode::MalformedToken);
}

TEST_F(TokenValidatorTest, RejectsTokenAfterKeyLeavesEligibleSet) {
    auto token = issue(7 * 24h);
    keys_.rotate();

    keys_.clock->advance(24h + 5min);
    EXPECT_TRUE(validator_.validate(token).hasValue());

    keys_.clock->advance(1s);
    EXPECT_EQ(validator_.validate(token).error().code(), ErrorCode::SignatureInvalid);
}

TEST(TokenValidatorBootstrapTest, NotBootstrapped) {
    BootstrappedStore empty;
    TokenValidator validator(empty.store, empty.clock);
    auto result = validator.validate("a.b.c");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NoActiveKey);
    EXPECT_EQ(result.error().context<ValidationFailure>()->reason,
              ValidationFailureReason::NotBootstrapped);
}

TEST(ValidationFailureReasonTest, Names) {
    EXPECT_EQ(validationFailureReasonName(ValidationFailureReason::Expired), "expired");
    EXPECT_EQ(validationFailureReasonName(ValidationFailureReason::SignatureInvalid),
              "signature_invalid");
}
