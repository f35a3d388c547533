#pragma once

/// @file rsa_utils.hpp
/// @brief RSA key generation, PEM export, RS256 signing/verification and
///        JWK component extraction on the OpenSSL 3.x EVP API.
///
/// Keys move across this boundary as PEM strings only. PEM parsing goes
/// through BIO_new_mem_buf so no file I/O is involved.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "crypto_utils.hpp"

namespace keyring::crypto {

namespace detail {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

inline PkeyPtr loadPrivateKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
}

inline PkeyPtr loadPublicKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
}

// Drain a memory BIO into a string.
inline std::optional<std::string> bioToString(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return std::nullopt;
    }
    return std::string(data, static_cast<std::size_t>(len));
}

inline std::string bignumToBase64url(const BIGNUM* bn) {
    std::vector<uint8_t> bytes(static_cast<std::size_t>(BN_num_bytes(bn)));
    BN_bn2bin(bn, bytes.data());
    return base64urlEncode(bytes.data(), bytes.size());
}

}  // namespace detail

/// PEM-encoded halves of a freshly generated key pair.
struct RsaKeyPairPem {
    std::string privateKeyPem;  ///< PKCS#8 "BEGIN PRIVATE KEY"
    std::string publicKeyPem;   ///< SubjectPublicKeyInfo "BEGIN PUBLIC KEY"
};

/// Generate an RSA key pair with public exponent 65537.
///
/// @param bits Modulus size in bits.
/// @return The PEM pair, or nullopt if OpenSSL fails (e.g. RNG unavailable).
[[nodiscard]] inline std::optional<RsaKeyPairPem> generateRsaKeyPairPem(unsigned int bits) {
    detail::PkeyPtr pkey(EVP_RSA_gen(bits));
    if (!pkey) {
        return std::nullopt;
    }

    detail::BioPtr privBio(BIO_new(BIO_s_mem()));
    detail::BioPtr pubBio(BIO_new(BIO_s_mem()));
    if (!privBio || !pubBio) {
        return std::nullopt;
    }

    if (PEM_write_bio_PrivateKey(
            privBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        return std::nullopt;
    }
    if (PEM_write_bio_PUBKEY(pubBio.get(), pkey.get()) != 1) {
        return std::nullopt;
    }

    auto privatePem = detail::bioToString(privBio.get());
    auto publicPem = detail::bioToString(pubBio.get());
    if (!privatePem || !publicPem) {
        if (privatePem) {
            secureErase(*privatePem);
        }
        return std::nullopt;
    }

    // The memory BIO still holds a copy of the private key.
    char* data = nullptr;
    long len = BIO_get_mem_data(privBio.get(), &data);
    if (len > 0 && data != nullptr) {
        OPENSSL_cleanse(data, static_cast<std::size_t>(len));
    }

    return RsaKeyPairPem{std::move(*privatePem), std::move(*publicPem)};
}

/// Sign a message with RSASSA-PKCS1-v1_5 / SHA-256.
///
/// @return Raw signature bytes, or empty vector on failure.
[[nodiscard]] inline std::vector<uint8_t> rsaSha256Sign(std::string_view privateKeyPem,
                                                        std::string_view message) {
    auto pkey = detail::loadPrivateKey(privateKeyPem);
    if (!pkey) {
        return {};
    }

    detail::MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return {};
    }

    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return {};
    }

    // RSA signatures are exactly the modulus size.
    std::size_t sigLen = static_cast<std::size_t>(EVP_PKEY_get_size(pkey.get()));
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(ctx.get(),
                       signature.data(),
                       &sigLen,
                       reinterpret_cast<const unsigned char*>(message.data()),
                       message.size()) != 1) {
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify an RSASSA-PKCS1-v1_5 / SHA-256 signature.
[[nodiscard]] inline bool rsaSha256Verify(std::string_view publicKeyPem,
                                          std::string_view message,
                                          const std::vector<uint8_t>& signature) {
    auto pkey = detail::loadPublicKey(publicKeyPem);
    if (!pkey) {
        return false;
    }

    detail::MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1) {
        return false;
    }

    return EVP_DigestVerify(ctx.get(),
                            signature.data(),
                            signature.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

/// Base64URL big-endian modulus and exponent of an RSA public key.
struct RsaPublicComponents {
    std::string n;
    std::string e;
};

/// Extract the JWK "n" and "e" members from a PEM public key.
[[nodiscard]] inline std::optional<RsaPublicComponents> rsaPublicComponents(
    std::string_view publicKeyPem) {
    auto pkey = detail::loadPublicKey(publicKeyPem);
    if (!pkey || EVP_PKEY_get_base_id(pkey.get()) != EVP_PKEY_RSA) {
        return std::nullopt;
    }

    BIGNUM* nRaw = nullptr;
    BIGNUM* eRaw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_N, &nRaw) != 1) {
        return std::nullopt;
    }
    detail::BignumPtr n(nRaw);
    if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_E, &eRaw) != 1) {
        return std::nullopt;
    }
    detail::BignumPtr e(eRaw);

    return RsaPublicComponents{detail::bignumToBase64url(n.get()),
                               detail::bignumToBase64url(e.get())};
}

/// Modulus size in bits of a PEM public key, or 0 if it cannot be parsed.
[[nodiscard]] inline int rsaPublicKeyBits(std::string_view publicKeyPem) {
    auto pkey = detail::loadPublicKey(publicKeyPem);
    return pkey ? EVP_PKEY_get_bits(pkey.get()) : 0;
}

/// True if both PEMs parse as RSA and the public key matches the private key.
[[nodiscard]] inline bool rsaKeyPairMatches(std::string_view privateKeyPem,
                                            std::string_view publicKeyPem) {
    auto priv = detail::loadPrivateKey(privateKeyPem);
    auto pub = detail::loadPublicKey(publicKeyPem);
    if (!priv || !pub) {
        return false;
    }
    if (EVP_PKEY_get_base_id(priv.get()) != EVP_PKEY_RSA ||
        EVP_PKEY_get_base_id(pub.get()) != EVP_PKEY_RSA) {
        return false;
    }
    return EVP_PKEY_eq(priv.get(), pub.get()) == 1;
}

}  // namespace keyring::crypto
