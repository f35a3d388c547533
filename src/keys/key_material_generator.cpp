/// @file key_material_generator.cpp
/// @brief RsaKeyMaterialGenerator implementation.

#include "keyring/keys/key_material_generator.hpp"

#include "crypto/rsa_utils.hpp"
#include "keyring/foundation/keyring_logger.hpp"

#include <utility>

namespace keyring::keys {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

RsaKeyMaterialGenerator::RsaKeyMaterialGenerator(uint32_t keyBits,
                                                 std::shared_ptr<const foundation::Clock> clock)
    : keyBits_(keyBits), clock_(clock ? std::move(clock) : foundation::systemClock()) {}

KeyringResult<KeyRecord> RsaKeyMaterialGenerator::generate() {
    auto keyId = crypto::randomUuidV4();
    if (!keyId) {
        KEYRING_LOG_ERROR(LogCategory::KeyGen, "CSPRNG failed while drawing a key id");
        return KeyringResult<KeyRecord>::err(
            KeyringError(ErrorCode::RandomnessUnavailable, "RAND_bytes failed for key id"));
    }

    auto pair = crypto::generateRsaKeyPairPem(keyBits_);
    if (!pair) {
        LogContext ctx;
        ctx.keyId = *keyId;
        ctx.extra["bits"] = std::to_string(keyBits_);
        foundation::KeyringLogger::instance().logWithContext(
            LogLevel::Error, LogCategory::KeyGen, "RSA key pair construction failed", ctx);
        return KeyringResult<KeyRecord>::err(KeyringError(
            ErrorCode::KeyGenerationFailed,
            "EVP_RSA_gen failed for " + std::to_string(keyBits_) + "-bit key"));
    }

    KeyRecord record;
    record.keyId = std::move(*keyId);
    record.privateKeyPem = std::move(pair->privateKeyPem);
    record.publicKeyPem = std::move(pair->publicKeyPem);
    record.keyBits = keyBits_;
    record.createdAt = clock_->now();
    record.state = KeyState::Standby;

    LogContext ctx;
    ctx.keyId = record.keyId;
    foundation::KeyringLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::KeyGen, "Generated key pair", ctx);

    return KeyringResult<KeyRecord>::ok(std::move(record));
}

KeyringResult<uint32_t> validateKeyPair(std::string_view privateKeyPem,
                                        std::string_view publicKeyPem) {
    if (privateKeyPem.empty() || publicKeyPem.empty()) {
        return KeyringResult<uint32_t>::err(
            KeyringError(ErrorCode::InvalidKeyMaterial, "missing PEM material"));
    }
    if (!crypto::rsaKeyPairMatches(privateKeyPem, publicKeyPem)) {
        return KeyringResult<uint32_t>::err(KeyringError(
            ErrorCode::InvalidKeyMaterial, "PEM material is not a matching RSA key pair"));
    }
    auto bits = crypto::rsaPublicKeyBits(publicKeyPem);
    return KeyringResult<uint32_t>::ok(static_cast<uint32_t>(bits));
}

}  // namespace keyring::keys
