#pragma once

/// @file key_material_generator.hpp
/// @brief Fresh RSA key pairs for the rotation subsystem.
///
/// Key identifiers and key material both come from the OpenSSL CSPRNG.
/// Generation is CPU-bound and may take hundreds of milliseconds at 2048+
/// bits; callers must never hold the key store lock while calling generate().

#include <cstdint>
#include <memory>
#include <string_view>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_types.hpp"

namespace keyring::keys {

using foundation::KeyringResult;

/// Source of new key records.
///
/// Implementations must be thread-safe.
class IKeyMaterialGenerator {
public:
    virtual ~IKeyMaterialGenerator() = default;

    /// Produce a new Standby record with a fresh key id.
    ///
    /// Errors: KeyGenerationFailed, RandomnessUnavailable.
    [[nodiscard]] virtual KeyringResult<KeyRecord> generate() = 0;
};

/// RSA generator backed by EVP_RSA_gen (public exponent 65537).
class RsaKeyMaterialGenerator : public IKeyMaterialGenerator {
public:
    RsaKeyMaterialGenerator(uint32_t keyBits, std::shared_ptr<const foundation::Clock> clock);

    [[nodiscard]] KeyringResult<KeyRecord> generate() override;

    [[nodiscard]] uint32_t keyBits() const noexcept { return keyBits_; }

private:
    uint32_t keyBits_;
    std::shared_ptr<const foundation::Clock> clock_;
};

/// Check that persisted PEM material parses as RSA and that the public key
/// belongs to the private key.
///
/// @return The modulus size in bits, or InvalidKeyMaterial.
[[nodiscard]] KeyringResult<uint32_t> validateKeyPair(std::string_view privateKeyPem,
                                                      std::string_view publicKeyPem);

}  // namespace keyring::keys
