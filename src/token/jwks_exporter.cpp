/// @file jwks_exporter.cpp
/// @brief JwksExporter implementation.

#include "keyring/token/jwks_exporter.hpp"

#include "crypto/rsa_utils.hpp"
#include "json_codec.hpp"
#include "keyring/foundation/keyring_logger.hpp"

#include <utility>

namespace keyring::token {

using foundation::KeyringLogger;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

JwksExporter::JwksExporter(std::shared_ptr<const keys::IKeyView> keys) : keys_(std::move(keys)) {}

KeyringResult<JwkSet> JwksExporter::keySet() const {
    auto eligible = keys_->getEligibleForValidation();
    if (!eligible) {
        return KeyringResult<JwkSet>::err(eligible.error());
    }

    JwkSet set;
    set.keys.reserve(eligible.value().size());
    for (const auto& key : eligible.value()) {
        auto components = crypto::rsaPublicComponents(key.publicKeyPem);
        if (!components) {
            LogContext ctx;
            ctx.keyId = key.keyId;
            KeyringLogger::instance().logWithContext(
                LogLevel::Error, LogCategory::Token, "Public key unreadable; omitted from JWKS",
                ctx);
            continue;
        }
        Jwk jwk;
        jwk.alg = key.algorithm;
        jwk.kid = key.keyId;
        jwk.n = std::move(components->n);
        jwk.e = std::move(components->e);
        set.keys.push_back(std::move(jwk));
    }
    return KeyringResult<JwkSet>::ok(std::move(set));
}

KeyringResult<std::string> JwksExporter::exportJwks() const {
    auto set = keySet();
    if (!set) {
        return KeyringResult<std::string>::err(set.error());
    }
    return KeyringResult<std::string>::ok(toJson(set.value()));
}

std::string JwksExporter::toJson(const JwkSet& set) {
    std::string out = "{\"keys\":[";
    for (std::size_t i = 0; i < set.keys.size(); ++i) {
        const auto& jwk = set.keys[i];
        if (i > 0) {
            out.push_back(',');
        }
        out += "{\"kty\":" + detail::jsonQuote(jwk.kty);
        out += ",\"use\":" + detail::jsonQuote(jwk.use);
        out += ",\"alg\":" + detail::jsonQuote(jwk.alg);
        out += ",\"kid\":" + detail::jsonQuote(jwk.kid);
        out += ",\"n\":" + detail::jsonQuote(jwk.n);
        out += ",\"e\":" + detail::jsonQuote(jwk.e);
        out.push_back('}');
    }
    out += "]}";
    return out;
}

}  // namespace keyring::token
