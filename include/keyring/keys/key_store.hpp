#pragma once

/// @file key_store.hpp
/// @brief Copy-on-write registry of signing keys and their lifecycle state.
///
/// All mutation is serialized on one mutex per store. Each mutation builds a
/// new immutable KeySet and swaps the published pointer; readers lock only
/// long enough to copy that pointer, so they always see either the whole
/// pre-mutation set or the whole post-mutation set and never wait behind key
/// generation (which happens outside the store entirely).

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_types.hpp"

namespace keyring::keys {

using foundation::KeyringResult;

/// Retention rules applied by the store.
struct KeyStorePolicy {
    /// How long a demoted key keeps verifying (expiresAt = retiringSince + overlap).
    std::chrono::seconds overlapDuration{std::chrono::hours(24)};

    /// Clock-skew allowance added on top of expiresAt for eligibility.
    std::chrono::seconds validationGracePeriod{std::chrono::minutes(5)};

    /// Upper bound on retained keys after a sweep.
    std::size_t maxRetainedKeys = 5;
};

/// Outcome of a successful promotion.
struct PromotionResult {
    std::string activatedKeyId;
    std::optional<std::string> retiredKeyId;
    uint64_t rotationEpoch = 0;
    TimePoint promotedAt{};
};

/// Keys touched by one sweep.
struct SweepReport {
    std::vector<std::string> expired;        ///< Retiring -> Expired by deadline.
    std::vector<std::string> forceExpired;   ///< Expired early by the retention bound.
    std::vector<std::string> removed;        ///< Every key dropped from the store.
    std::size_t retained = 0;

    [[nodiscard]] bool changed() const noexcept { return !removed.empty() || !expired.empty(); }
};

/// Point-in-time view of the whole store without key material.
struct KeySetSnapshot {
    std::vector<KeyMetadata> keys;  ///< Ordered by createdAt, oldest first.
    std::optional<std::string> activeKeyId;
    std::optional<std::string> standbyKeyId;
    uint64_t rotationEpoch = 0;
};

/// Read-only access used by the issuer, validator and JWKS exporter.
class IKeyView {
public:
    virtual ~IKeyView() = default;

    /// The single Active key. NoActiveKey before bootstrap.
    [[nodiscard]] virtual KeyringResult<SigningKey> getActive() const = 0;

    /// Active key first, then Retiring keys with now <= expiresAt + grace,
    /// newest first. NoActiveKey before bootstrap.
    [[nodiscard]] virtual KeyringResult<std::vector<VerificationKey>>
    getEligibleForValidation() const = 0;
};

/// Thread-safe key registry.
///
/// Only the RotationController mutates a store; consumers hold it as an
/// IKeyView.
///
/// Example:
/// @code
///   KeyStore store(KeyStorePolicy{}, clock);
///   store.insertStandby(generator.generate().value());
///   auto promoted = store.promoteStandbyToActive();
///   auto signing = store.getActive();
/// @endcode
class KeyStore : public IKeyView {
public:
    explicit KeyStore(KeyStorePolicy policy,
                      std::shared_ptr<const foundation::Clock> clock = nullptr);
    ~KeyStore() override;

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    // ── Reads ───────────────────────────────────────────────────────────

    [[nodiscard]] KeyringResult<SigningKey> getActive() const override;

    [[nodiscard]] KeyringResult<std::vector<VerificationKey>>
    getEligibleForValidation() const override;

    /// Metadata of the Active key, or nullopt before bootstrap.
    [[nodiscard]] std::optional<KeyMetadata> activeMetadata() const;

    /// Metadata of every key currently held.
    [[nodiscard]] KeySetSnapshot snapshot() const;

    /// Number of promotions applied since construction (restores excluded).
    [[nodiscard]] uint64_t rotationEpoch() const;

    [[nodiscard]] bool hasActive() const;
    [[nodiscard]] bool hasStandby() const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const KeyStorePolicy& policy() const noexcept { return policy_; }

    // ── Mutations ───────────────────────────────────────────────────────

    /// Add a freshly generated key as the standby.
    ///
    /// Errors: StandbyAlreadyExists, AlreadyExists (key id collision),
    /// InvalidArgument (record not Standby or missing material).
    KeyringResult<void> insertStandby(KeyRecord record);

    /// Atomically demote the Active key to Retiring and promote the standby.
    ///
    /// The demoted key's stored private material is wiped. On error the
    /// published set is unchanged.
    ///
    /// Errors: NoStandbyKey, KeyStoreInvariantViolation.
    KeyringResult<PromotionResult> promoteStandbyToActive();

    /// Drop the standby without promoting it.
    ///
    /// @return The discarded key id, or NoStandbyKey.
    KeyringResult<std::string> discardStandby();

    /// Install a persisted key directly as Active. Only valid while no key
    /// is active; keeps the record's createdAt and activatedAt.
    ///
    /// Errors: AlreadyExists, InvalidArgument.
    KeyringResult<void> restoreActive(KeyRecord record);

    /// Expire Retiring keys past expiresAt + grace, drop every Expired key,
    /// then force-expire the oldest non-active, non-standby keys until at
    /// most maxRetainedKeys remain. Never removes the Active key.
    SweepReport sweepExpired(TimePoint now);

private:
    struct KeySet;

    [[nodiscard]] std::shared_ptr<const KeySet> current() const;

    KeyStorePolicy policy_;
    std::shared_ptr<const foundation::Clock> clock_;

    mutable std::mutex mutex_;
    std::shared_ptr<const KeySet> current_;
};

}  // namespace keyring::keys
