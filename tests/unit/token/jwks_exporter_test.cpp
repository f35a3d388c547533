#include <gtest/gtest.h>

#include "crypto/rsa_utils.hpp"
#include "keyring/token/jwks_exporter.hpp"
#include "support/bootstrapped_store.hpp"

#include <chrono>
#include <string>

using namespace keyring::token;
using namespace std::chrono_literals;
using keyring::foundation::ErrorCode;
using keyring::keys::KeyStorePolicy;
using keyring::test_support::BootstrappedStore;

class JwksExporterTest : public ::testing::Test {
protected:
    BootstrappedStore keys_{KeyStorePolicy{24h, 5min, 5}};
    JwksExporter exporter_{keys_.store};
};

TEST_F(JwksExporterTest, NoActiveKeyBeforeBootstrap) {
    EXPECT_EQ(exporter_.keySet().error().code(), ErrorCode::NoActiveKey);
    EXPECT_EQ(exporter_.exportJwks().error().code(), ErrorCode::NoActiveKey);
}

TEST_F(JwksExporterTest, SingleActiveKey) {
    const auto kid = keys_.rotate();
    auto set = exporter_.keySet();
    ASSERT_TRUE(set.hasValue());
    ASSERT_EQ(set.value().keys.size(), 1u);

    const auto& jwk = set.value().keys.front();
    EXPECT_EQ(jwk.kty, "RSA");
    EXPECT_EQ(jwk.use, "sig");
    EXPECT_EQ(jwk.alg, "RS256");
    EXPECT_EQ(jwk.kid, kid);
    EXPECT_EQ(jwk.e, "AQAB");

    auto active = keys_.store->getEligibleForValidation().value().front();
    auto components = keyring::crypto::rsaPublicComponents(active.publicKeyPem);
    ASSERT_TRUE(components.has_value());
    EXPECT_EQ(jwk.n, components->n);
}

TEST_F(JwksExporterTest, DocumentMemberOrder) {
    const auto kid = keys_.rotate();
    auto json = exporter_.exportJwks();
    ASSERT_TRUE(json.hasValue());

    const auto& doc = json.value();
    const std::string prefix =
        R"({"keys":[{"kty":"RSA","use":"sig","alg":"RS256","kid":")" + kid + R"(","n":")";
    EXPECT_EQ(doc.rfind(prefix, 0), 0u);
    EXPECT_NE(doc.find(R"(","e":"AQAB"}]})"), std::string::npos);
}

TEST_F(JwksExporterTest, NoPrivateMembers) {
    keys_.rotate();
    keys_.rotate();
    auto doc = exporter_.exportJwks().value();
    for (const char* member : {"\"d\"", "\"p\"", "\"q\"", "\"dp\"", "\"dq\"", "\"qi\"", "PRIVATE"}) {
        EXPECT_EQ(doc.find(member), std::string::npos) << member;
    }
}

TEST_F(JwksExporterTest, ActiveFirstThenRetiringNewestFirst) {
    const auto oldest = keys_.rotate();
    keys_.clock->advance(1h);
    const auto middle = keys_.rotate();
    keys_.clock->advance(1h);
    const auto newest = keys_.rotate();

    auto set = exporter_.keySet();
    ASSERT_TRUE(set.hasValue());
    ASSERT_EQ(set.value().keys.size(), 3u);
    EXPECT_EQ(set.value().keys[0].kid, newest);
    EXPECT_EQ(set.value().keys[1].kid, middle);
    EXPECT_EQ(set.value().keys[2].kid, oldest);
}

TEST_F(JwksExporterTest, StandbyIsNotPublished) {
    const auto active = keys_.rotate();
    keyring::keys::RsaKeyMaterialGenerator generator(keyring::test_support::kTestKeyBits,
                                                     keys_.clock);
    auto standby = generator.generate();
    ASSERT_TRUE(standby.hasValue());
    ASSERT_TRUE(keys_.store->insertStandby(std::move(standby).value()).hasValue());

    auto set = exporter_.keySet();
    ASSERT_TRUE(set.hasValue());
    ASSERT_EQ(set.value().keys.size(), 1u);
    EXPECT_EQ(set.value().keys.front().kid, active);
}

TEST_F(JwksExporterTest, ExpiredKeysDropOut) {
    const auto first = keys_.rotate();
    const auto second = keys_.rotate();
    ASSERT_EQ(exporter_.keySet().value().keys.size(), 2u);

    keys_.clock->advance(24h + 5min + 1s);
    auto set = exporter_.keySet();
    ASSERT_TRUE(set.hasValue());
    ASSERT_EQ(set.value().keys.size(), 1u);
    EXPECT_EQ(set.value().keys.front().kid, second);
    EXPECT_NE(set.value().keys.front().kid, first);
}

TEST(JwksSerializationTest, EmptySet) {
    EXPECT_EQ(JwksExporter::toJson(JwkSet{}), R"({"keys":[]})");
}
