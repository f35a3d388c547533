#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "keyring/foundation/keyring_result.hpp"

namespace keyring::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "keyring.overlap_seconds") and setting values at runtime.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    KeyringResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    /// @return Success or ConfigLoadFailed error.
    KeyringResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key (e.g., "keyring.key_size_bits").
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    KeyringResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back to @p fallback only when the
    /// key is absent. A present key of the wrong type is still an error.
    template <typename T>
    KeyringResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    /// Flatten a YAML node recursively into the entries_ map.
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
KeyringResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return KeyringResult<T>::err(
            KeyringError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return KeyringResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return KeyringResult<T>::err(
            KeyringError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
KeyringResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return KeyringResult<T>::ok(std::move(fallback));
    }
    return result;
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    std::lock_guard lock(mutex_);
    entries_[std::string(key)] = YAML::Node(value);
}

} // namespace keyring::foundation
