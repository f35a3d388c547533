#pragma once

/// @file crypto_utils.hpp
/// @brief Internal encoding and randomness helpers: Base64URL, hex,
///        CSPRNG bytes, UUIDv4 key identifiers.
///
/// Randomness comes from OpenSSL's RAND_bytes; std::random_device is not
/// guaranteed to be cryptographically secure and is never used here.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace keyring::crypto {

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5)
// =============================================================================

/// Encode bytes to base64url (no padding).
[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

/// Encode a string to base64url.
[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

/// Decode unpadded base64url. Returns nullopt on any character outside the
/// URL-safe alphabet, on padding, and on an impossible length (len % 4 == 1).
[[nodiscard]] inline std::optional<std::vector<uint8_t>> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::vector<uint8_t> result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

/// Decode base64url to a string. Returns nullopt on invalid input.
[[nodiscard]] inline std::optional<std::string> base64urlDecodeString(std::string_view input) {
    auto bytes = base64urlDecode(input);
    if (!bytes) {
        return std::nullopt;
    }
    return std::string(bytes->begin(), bytes->end());
}

// =============================================================================
// Hex encoding
// =============================================================================

/// Encode bytes to lowercase hex string.
[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill @p numBytes from the OpenSSL CSPRNG. Returns nullopt if the
/// generator is not seeded or fails.
[[nodiscard]] inline std::optional<std::vector<uint8_t>> secureRandomBytes(std::size_t numBytes) {
    std::vector<uint8_t> buf(numBytes);
    if (numBytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        return std::nullopt;
    }
    return buf;
}

/// Hex-encoded CSPRNG bytes, or nullopt on failure.
[[nodiscard]] inline std::optional<std::string> secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    if (!bytes) {
        return std::nullopt;
    }
    return toHex(bytes->data(), bytes->size());
}

/// RFC 4122 version 4 UUID ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx") from
/// the CSPRNG, or nullopt on failure.
[[nodiscard]] inline std::optional<std::string> randomUuidV4() {
    std::array<uint8_t, 16> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        return std::nullopt;
    }
    raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

    auto hex = toHex(raw.data(), raw.size());
    OPENSSL_cleanse(raw.data(), raw.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// =============================================================================
// Secure erase
// =============================================================================

/// Overwrite a string's buffer before it is released.
inline void secureErase(std::string& secret) {
    if (!secret.empty()) {
        OPENSSL_cleanse(secret.data(), secret.size());
    }
    secret.clear();
}

}  // namespace keyring::crypto
