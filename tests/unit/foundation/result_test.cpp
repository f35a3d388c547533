#include <gtest/gtest.h>

#include <string>

#include "keyring/core/result.hpp"
#include "keyring/foundation/error_code.hpp"
#include "keyring/foundation/keyring_error.hpp"
#include "keyring/foundation/keyring_result.hpp"

using namespace keyring::foundation;

// --- Result<T, E> ---

TEST(ResultTest, OkValue) {
    auto result = keyring::Result<int, std::string>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = keyring::Result<int, std::string>::err("something failed");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = keyring::Result<std::string, std::string>::ok("value");
    auto err = keyring::Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ValueOr) {
    auto ok = keyring::Result<int, std::string>::ok(10);
    auto err = keyring::Result<int, std::string>::err("fail");
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = keyring::Result<int, std::string>::ok(1);
    auto err = keyring::Result<int, std::string>::err("fail");
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOutValue) {
    auto result = keyring::Result<std::string, int>::ok(std::string(64, 'x'));
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved.size(), 64u);
}

TEST(ResultVoidTest, Ok) {
    auto result = keyring::Result<void, std::string>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = keyring::Result<void, std::string>::err("void error");
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error(), "void error");
}

// --- ErrorCode ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::KeyGenerationFailed), "KeyMaterial");
    EXPECT_EQ(errorSubsystem(ErrorCode::RandomnessUnavailable), "KeyMaterial");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoActiveKey), "KeyStore");
    EXPECT_EQ(errorSubsystem(ErrorCode::RotationFailed), "Rotation");
    EXPECT_EQ(errorSubsystem(ErrorCode::TokenExpired), "Token");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::PersistedKeyCorrupt), "SecretStore");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

// --- KeyringError ---

TEST(KeyringErrorTest, DefaultConstruction) {
    KeyringError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(KeyringErrorTest, CodeAndMessage) {
    KeyringError err(ErrorCode::NoStandbyKey, "no standby");
    EXPECT_EQ(err.code(), ErrorCode::NoStandbyKey);
    EXPECT_EQ(err.message(), "no standby");
    EXPECT_EQ(err.subsystem(), "KeyStore");
}

TEST(KeyringErrorTest, WithContext) {
    struct Attempt {
        int keysTried = 0;
    };
    KeyringError err(ErrorCode::SignatureInvalid, "no key matched", Attempt{3});
    EXPECT_TRUE(err.hasContext());
    const auto* attempt = err.context<Attempt>();
    ASSERT_NE(attempt, nullptr);
    EXPECT_EQ(attempt->keysTried, 3);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(KeyringErrorTest, NestedErrorAsContext) {
    KeyringError inner(ErrorCode::KeyGenerationFailed, "EVP_RSA_gen failed");
    KeyringError outer(ErrorCode::RotationFailed, "no standby key available", inner);
    const auto* cause = outer.context<KeyringError>();
    ASSERT_NE(cause, nullptr);
    EXPECT_EQ(cause->code(), ErrorCode::KeyGenerationFailed);
}

// --- KeyringResult ---

TEST(KeyringResultTest, OkValue) {
    auto result = KeyringResult<int>::ok(7);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 7);
}

TEST(KeyringResultTest, ErrorValue) {
    auto result = KeyringResult<int>::err(KeyringError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(KeyringResultTest, VoidError) {
    auto result = KeyringResult<void>::err(KeyringError(ErrorCode::NotBootstrapped));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotBootstrapped);
}
