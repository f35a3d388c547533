#pragma once

/// @file secret_store.hpp
/// @brief Opaque key/value secret persistence interface and in-memory
///        implementation.
///
/// The rotation controller stores the active key and the standby here so a
/// restart resumes with the same signing key. Encryption at rest is the backend's concern.

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keyring::keys {

/// Entry names used to persist the active key and the standby.
namespace secret_keys {
inline constexpr std::string_view kActiveKeyId = "keyring/active_kid";
inline constexpr std::string_view kStandbyKeyId = "keyring/standby_kid";
inline constexpr std::string_view kKeyPrefix = "keyring/keys/";
inline constexpr std::string_view kPrivatePem = "/private_pem";
inline constexpr std::string_view kPublicPem = "/public_pem";
inline constexpr std::string_view kCreatedAt = "/created_at";
inline constexpr std::string_view kActivatedAt = "/activated_at";

/// Full entry name for one field of a persisted key.
[[nodiscard]] inline std::string entry(std::string_view keyId, std::string_view field) {
    std::string name(kKeyPrefix);
    name.append(keyId);
    name.append(field);
    return name;
}
}  // namespace secret_keys

/// Abstract interface for secret persistence.
///
/// Implementations must be thread-safe when shared across threads.
class ISecretStore {
public:
    virtual ~ISecretStore() = default;

    /// Read a value. Returns nullopt if the entry does not exist.
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view name) const = 0;

    /// Create or overwrite a value. Returns false if the backend rejected it.
    virtual bool put(std::string_view name, std::string value) = 0;

    /// Delete a value. Returns false if the entry did not exist.
    virtual bool remove(std::string_view name) = 0;
};

/// Thread-safe in-memory secret store for testing and development.
///
/// Values are wiped when overwritten, removed, or destroyed.
class InMemorySecretStore : public ISecretStore {
public:
    InMemorySecretStore() = default;
    ~InMemorySecretStore() override;

    InMemorySecretStore(const InMemorySecretStore&) = delete;
    InMemorySecretStore& operator=(const InMemorySecretStore&) = delete;

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override;

    bool put(std::string_view name, std::string value) override;

    bool remove(std::string_view name) override;

    /// Number of stored entries.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
};

}  // namespace keyring::keys
