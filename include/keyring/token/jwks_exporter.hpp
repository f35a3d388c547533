#pragma once

/// @file jwks_exporter.hpp
/// @brief RFC 7517 JSON Web Key Set of the eligible public keys.

#include <memory>
#include <string>
#include <vector>

#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_store.hpp"

namespace keyring::token {

using foundation::KeyringResult;

/// One RSA public key in JWK form. Only public members exist here.
struct Jwk {
    std::string kty{"RSA"};
    std::string use{"sig"};
    std::string alg;
    std::string kid;
    std::string n;  ///< Base64URL modulus.
    std::string e;  ///< Base64URL public exponent.
};

/// Structured key set, in publication order.
struct JwkSet {
    std::vector<Jwk> keys;
};

/// Renders the eligible set for a well-known JWKS endpoint.
///
/// Output shape, member order fixed:
/// @code
///   {"keys":[{"kty":"RSA","use":"sig","alg":"RS256","kid":"...","n":"...","e":"AQAB"}]}
/// @endcode
/// The active key comes first, then retiring keys newest first.
class JwksExporter {
public:
    explicit JwksExporter(std::shared_ptr<const keys::IKeyView> keys);

    /// Structured key set.
    ///
    /// Errors: NoActiveKey before bootstrap. A key whose public PEM cannot
    /// be parsed is skipped and logged.
    [[nodiscard]] KeyringResult<JwkSet> keySet() const;

    /// Serialized key set document.
    [[nodiscard]] KeyringResult<std::string> exportJwks() const;

    /// Serialize a structured key set.
    [[nodiscard]] static std::string toJson(const JwkSet& set);

private:
    std::shared_ptr<const keys::IKeyView> keys_;
};

}  // namespace keyring::token
