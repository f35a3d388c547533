#pragma once

/// @file rotation_controller.hpp
/// @brief The only mutator of the KeyStore: bootstrap, scheduled and
///        forced rotation, standby pre-generation and sweeping.
///
/// Rotation sequence (under the rotation lock):
///   1. ensure a standby exists (generated outside the store lock)
///   2. promote it; the previous active key becomes Retiring
///   3. persist the new active key to the secret store
///   4. pre-generate the next standby if configured
///   5. sweep expired keys and apply the retention bound
///
/// A failure in step 1 or 2 leaves the previous active key in place. A
/// failure in step 4 does not undo the promotion; the standby is retried on
/// the next scheduler tick or forced rotation.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_material_generator.hpp"
#include "keyring/keys/key_store.hpp"
#include "keyring/keys/secret_store.hpp"
#include "keyring/rotation/rotation_config.hpp"
#include "keyring/rotation/rotation_events.hpp"

namespace keyring::rotation {

using foundation::TimePoint;

/// Controller-level state.
enum class ControllerState : uint8_t {
    Idle,     ///< Waiting for the next deadline or a forced rotation.
    Rotating  ///< A promotion is in progress.
};

constexpr std::string_view controllerStateName(ControllerState state) {
    switch (state) {
        case ControllerState::Idle:     return "idle";
        case ControllerState::Rotating: return "rotating";
    }
    return "unknown";
}

/// What asked for a rotation.
enum class RotationTrigger : uint8_t {
    Scheduled,  ///< The rotation interval elapsed.
    Forced,     ///< Administrative request; coalesces with concurrent rotations.
    Emergency   ///< Forced, and any pre-generated standby is discarded first.
};

constexpr std::string_view rotationTriggerName(RotationTrigger trigger) {
    switch (trigger) {
        case RotationTrigger::Scheduled: return "scheduled";
        case RotationTrigger::Forced:    return "forced";
        case RotationTrigger::Emergency: return "emergency";
    }
    return "unknown";
}

/// Result of a rotation request.
struct RotationOutcome {
    RotationTrigger trigger = RotationTrigger::Forced;
    bool rotated = false;    ///< This call applied a promotion.
    bool coalesced = false;  ///< A concurrent rotation already satisfied the request.
    std::string activeKeyId;
    std::optional<std::string> retiredKeyId;
    uint64_t rotationEpoch = 0;
    bool standbyReady = false;  ///< A standby exists after the call.
};

/// Key health report for administrative introspection. No key material.
struct KeyHealth {
    std::string activeKeyId;
    std::optional<std::string> standbyKeyId;
    std::size_t totalKeys = 0;
    std::vector<keys::KeyMetadata> keys;
    ControllerState controllerState = ControllerState::Idle;
    uint64_t rotationCount = 0;
    std::optional<TimePoint> lastRotationAt;
    std::optional<TimePoint> nextRotationAt;
    std::optional<std::string> lastError;
    bool schedulerRunning = false;
};

/// Drives the key lifecycle.
///
/// Thread-safe. All rotations, standby generation and sweeps serialize on
/// one rotation lock; readers of the store are never blocked by it.
///
/// Example:
/// @code
///   RotationController controller(config, store, generator, clock, secrets, events);
///   if (auto r = controller.bootstrap(); !r) { return EXIT_FAILURE; }
///   controller.start();
///   ...
///   controller.forceRotate();
///   controller.stop();
/// @endcode
class RotationController {
public:
    /// Null collaborators are replaced with defaults: system clock, RSA
    /// generator at config.keySizeBits, in-memory secret store, null sink.
    RotationController(RotationConfig config,
                       std::shared_ptr<keys::KeyStore> store,
                       std::shared_ptr<keys::IKeyMaterialGenerator> generator = nullptr,
                       std::shared_ptr<const foundation::Clock> clock = nullptr,
                       std::shared_ptr<keys::ISecretStore> secretStore = nullptr,
                       std::shared_ptr<IRotationEventSink> events = nullptr);

    /// Stops the scheduler if it is running.
    ~RotationController();

    RotationController(const RotationController&) = delete;
    RotationController& operator=(const RotationController&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Install the first active key. Idempotent.
    ///
    /// Restores the persisted active key if the secret store holds a valid
    /// one, otherwise generates and activates a new key. Then pre-generates
    /// a standby if configured (failure there is logged, not returned).
    ///
    /// Errors: KeyGenerationFailed or RandomnessUnavailable when no first
    /// key can be produced; the process must not serve in that case.
    KeyringResult<void> bootstrap();

    [[nodiscard]] bool isBootstrapped() const;

    /// Start the background scheduler.
    ///
    /// Errors: NotBootstrapped, SchedulerAlreadyRunning.
    KeyringResult<void> start();

    /// Stop the scheduler and join its thread. A rotation already underway
    /// completes; no new one is started. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool isRunning() const;

    // ── Rotation ────────────────────────────────────────────────────────

    /// Rotate now.
    ///
    /// A Forced request that finds the rotation epoch advanced while it
    /// waited for the lock returns a coalesced outcome without rotating.
    ///
    /// Errors: NotBootstrapped, RotationFailed (previous key still active).
    KeyringResult<RotationOutcome> rotateNow(RotationTrigger trigger);

    /// Administrative rotation. True when a newer or equal active key is in
    /// place afterwards.
    bool forceRotate();

    /// Rotation that never promotes a previously generated standby.
    bool emergencyRotate();

    /// Rotate if the deadline has passed; otherwise retry standby
    /// generation and sweep. Returns rotated = false when nothing was due.
    KeyringResult<RotationOutcome> rotateIfDue();

    /// Sweep the store now.
    keys::SweepReport sweep();

    // ── Introspection ───────────────────────────────────────────────────

    [[nodiscard]] ControllerState state() const;

    /// max(active.activatedAt + rotationInterval,
    ///     lastRotationAt + validationGracePeriod); nullopt before bootstrap.
    [[nodiscard]] std::optional<TimePoint> nextRotationAt() const;

    [[nodiscard]] KeyHealth keyHealth() const;

    [[nodiscard]] const RotationConfig& config() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace keyring::rotation
