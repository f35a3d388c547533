#pragma once

/// @file keyring_service.hpp
/// @brief Facade wiring the key store, rotation controller, issuer,
///        validator and JWKS exporter into one explicitly owned service.
///
/// There is no process-wide instance. The embedding application constructs
/// a KeyringService, calls start() during startup and stop() during
/// shutdown, and hands the instance to whatever serves tokens.

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "keyring/foundation/clock.hpp"
#include "keyring/foundation/keyring_metrics.hpp"
#include "keyring/foundation/keyring_result.hpp"
#include "keyring/keys/key_material_generator.hpp"
#include "keyring/keys/secret_store.hpp"
#include "keyring/rotation/rotation_config.hpp"
#include "keyring/rotation/rotation_controller.hpp"
#include "keyring/rotation/rotation_events.hpp"
#include "keyring/token/claims.hpp"
#include "keyring/token/jwks_exporter.hpp"
#include "keyring/token/token_issuer.hpp"
#include "keyring/token/token_validator.hpp"

namespace keyring::service {

using foundation::KeyringResult;

/// External collaborators. Any member left null gets a default: system
/// clock, in-memory secret store, null event sink, RSA generator at the
/// configured key size, no health reporting.
struct KeyringCollaborators {
    std::shared_ptr<const foundation::Clock> clock;
    std::shared_ptr<keys::ISecretStore> secretStore;
    std::shared_ptr<rotation::IRotationEventSink> events;
    std::shared_ptr<keys::IKeyMaterialGenerator> generator;
    foundation::KeyringMetrics* metrics = nullptr;  ///< Health target, not owned.
};

/// Component name reported to KeyringMetrics health checks.
inline constexpr std::string_view kHealthComponent = "signing_keys";

/// JWT signing-key service.
///
/// Example:
/// @code
///   KeyringService service(config, {.secretStore = secrets});
///   if (auto started = service.start(); !started) { return EXIT_FAILURE; }
///
///   auto token = service.issue({{"sub", std::string("user-42")}});
///   auto verified = service.validate(token.value());
///   auto jwks = service.exportJwks();
///
///   service.stop();
/// @endcode
class KeyringService {
public:
    explicit KeyringService(rotation::RotationConfig config,
                            KeyringCollaborators collaborators = {});
    ~KeyringService();

    KeyringService(const KeyringService&) = delete;
    KeyringService& operator=(const KeyringService&) = delete;

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Bootstrap the first key (restore or generate) and start the
    /// rotation scheduler. Idempotent.
    ///
    /// Errors: KeyGenerationFailed / RandomnessUnavailable. Either is fatal;
    /// the service must not serve.
    KeyringResult<void> start();

    /// Stop the scheduler. Issuance and validation keep working with the
    /// current keys.
    void stop();

    [[nodiscard]] bool isRunning() const;

    // ── Signing / verification ──────────────────────────────────────────

    /// Sign @p claims valid for @p lifetime.
    [[nodiscard]] KeyringResult<std::string> issue(token::Claims claims,
                                                   std::chrono::seconds lifetime) const;

    /// Sign @p claims with the configured default lifetime.
    [[nodiscard]] KeyringResult<std::string> issue(token::Claims claims) const;

    /// Verify @p token against the eligible key set.
    [[nodiscard]] KeyringResult<token::VerifiedToken> validate(std::string_view token,
                                                               bool checkExpiry = true) const;

    // ── Publication ─────────────────────────────────────────────────────

    /// JWKS document for a well-known endpoint.
    [[nodiscard]] KeyringResult<std::string> exportJwks() const;

    // ── Administration ──────────────────────────────────────────────────

    /// Rotate now; concurrent calls coalesce.
    bool forceRotate();

    /// Rotate now without promoting any pre-generated standby.
    bool emergencyRotate();

    /// Key set and controller status.
    [[nodiscard]] rotation::KeyHealth keyHealth() const;

    [[nodiscard]] const rotation::RotationConfig& config() const;

    /// The underlying controller, for callers that need rotateNow() or
    /// rotateIfDue() directly.
    [[nodiscard]] rotation::RotationController& controller();

private:
    void reportHealth(foundation::HealthStatus status) const;

    rotation::RotationConfig config_;
    foundation::KeyringMetrics* metrics_;
    std::shared_ptr<keys::KeyStore> store_;
    std::unique_ptr<rotation::RotationController> controller_;
    std::unique_ptr<token::TokenIssuer> issuer_;
    std::unique_ptr<token::TokenValidator> validator_;
    std::unique_ptr<token::JwksExporter> exporter_;
};

}  // namespace keyring::service
