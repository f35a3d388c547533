#include <gtest/gtest.h>

#include "keyring/keys/key_material_generator.hpp"
#include "support/manual_clock.hpp"
#include "support/test_key_generator.hpp"

#include <memory>
#include <set>
#include <string>

using namespace keyring::keys;
using keyring::foundation::ErrorCode;
using keyring::test_support::kTestKeyBits;
using keyring::test_support::ManualClock;

class RsaKeyMaterialGeneratorTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    RsaKeyMaterialGenerator generator_{kTestKeyBits, clock_};
};

TEST_F(RsaKeyMaterialGeneratorTest, ProducesStandbyRecord) {
    auto result = generator_.generate();
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto& record = result.value();
    EXPECT_EQ(record.keyId.size(), 36u);
    EXPECT_EQ(record.state, KeyState::Standby);
    EXPECT_EQ(record.algorithm, kAlgorithmRs256);
    EXPECT_EQ(record.keyBits, kTestKeyBits);
    EXPECT_EQ(record.createdAt, clock_->now());
    EXPECT_FALSE(record.activatedAt.has_value());
    EXPECT_FALSE(record.retiringSince.has_value());
    EXPECT_FALSE(record.expiresAt.has_value());
}

TEST_F(RsaKeyMaterialGeneratorTest, KeyIdsAndMaterialAreUnique) {
    auto a = generator_.generate();
    auto b = generator_.generate();
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value().keyId, b.value().keyId);
    EXPECT_NE(a.value().publicKeyPem, b.value().publicKeyPem);
}

TEST_F(RsaKeyMaterialGeneratorTest, GeneratedPairValidates) {
    auto record = generator_.generate();
    ASSERT_TRUE(record.hasValue());
    auto bits = validateKeyPair(record.value().privateKeyPem, record.value().publicKeyPem);
    ASSERT_TRUE(bits.hasValue());
    EXPECT_EQ(bits.value(), kTestKeyBits);
}

TEST_F(RsaKeyMaterialGeneratorTest, ImpossibleKeySizeFails) {
    RsaKeyMaterialGenerator broken(0, clock_);
    auto result = broken.generate();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::KeyGenerationFailed);
}

TEST(ValidateKeyPairTest, RejectsMismatchedPair) {
    auto clock = std::make_shared<ManualClock>();
    RsaKeyMaterialGenerator generator(kTestKeyBits, clock);
    auto a = generator.generate();
    auto b = generator.generate();
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());

    auto result = validateKeyPair(a.value().privateKeyPem, b.value().publicKeyPem);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidKeyMaterial);
}

TEST(ValidateKeyPairTest, RejectsEmptyAndGarbage) {
    EXPECT_EQ(validateKeyPair("", "").error().code(), ErrorCode::InvalidKeyMaterial);
    EXPECT_EQ(validateKeyPair("garbage", "garbage").error().code(),
              ErrorCode::InvalidKeyMaterial);
}
