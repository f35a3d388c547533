#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the key rotation service.

#include <cstdint>
#include <string_view>

namespace keyring::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Key material (0x0100 - 0x01FF)
    KeyGenerationFailed = 0x0100,
    RandomnessUnavailable = 0x0101,
    InvalidKeyMaterial = 0x0102,

    // Key store (0x0200 - 0x02FF)
    NoActiveKey = 0x0200,
    StandbyAlreadyExists = 0x0201,
    NoStandbyKey = 0x0202,
    KeyStoreInvariantViolation = 0x0203,

    // Rotation (0x0300 - 0x03FF)
    RotationFailed = 0x0300,
    SchedulerAlreadyRunning = 0x0301,
    NotBootstrapped = 0x0302,

    // Token (0x0400 - 0x04FF)
    InvalidToken = 0x0400,
    MalformedToken = 0x0401,
    UnsupportedAlgorithm = 0x0402,
    SignatureInvalid = 0x0403,
    TokenExpired = 0x0404,
    SigningFailed = 0x0405,

    // Config (0x0500 - 0x05FF)
    ConfigLoadFailed = 0x0500,
    ConfigKeyNotFound = 0x0501,
    ConfigTypeMismatch = 0x0502,
    InvalidConfig = 0x0503,

    // Secret store (0x0600 - 0x06FF)
    SecretStoreError = 0x0600,
    PersistedKeyCorrupt = 0x0601,

    // Logger (0x0700 - 0x07FF)
    LoggerError = 0x0700,
    LoggerFlushFailed = 0x0701,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "KeyMaterial";
        case 0x0200: return "KeyStore";
        case 0x0300: return "Rotation";
        case 0x0400: return "Token";
        case 0x0500: return "Config";
        case 0x0600: return "SecretStore";
        case 0x0700: return "Logger";
        default: return "Unknown";
    }
}

} // namespace keyring::foundation
