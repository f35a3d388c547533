#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define KEYRING_VERSION_MAJOR 0
#define KEYRING_VERSION_MINOR 1
#define KEYRING_VERSION_PATCH 0
#define KEYRING_VERSION_STRING "0.1.0"

namespace keyring {

/// Project version information at compile time.
struct Version {
    static constexpr int major = KEYRING_VERSION_MAJOR;
    static constexpr int minor = KEYRING_VERSION_MINOR;
    static constexpr int patch = KEYRING_VERSION_PATCH;
    static constexpr const char* string = KEYRING_VERSION_STRING;
};

} // namespace keyring
