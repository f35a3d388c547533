/// @file keyring_service.cpp
/// @brief KeyringService implementation.

#include "keyring/service/keyring_service.hpp"

#include "keyring/foundation/keyring_logger.hpp"
#include "keyring/keys/key_store.hpp"
#include "keyring/token/token_issuer.hpp"

#include <utility>

namespace keyring::service {

using foundation::ErrorCode;
using foundation::HealthStatus;
using foundation::LogCategory;

KeyringService::KeyringService(rotation::RotationConfig config,
                               KeyringCollaborators collaborators)
    : config_(std::move(config)), metrics_(collaborators.metrics) {
    std::shared_ptr<const foundation::Clock> clock =
        collaborators.clock ? collaborators.clock : foundation::systemClock();

    std::shared_ptr<rotation::IRotationEventSink> events = collaborators.events;
    if (!events) {
        events = std::make_shared<rotation::NullEventSink>();
    }
    std::shared_ptr<keys::ISecretStore> secretStore = collaborators.secretStore;
    if (!secretStore) {
        secretStore = std::make_shared<keys::InMemorySecretStore>();
    }
    std::shared_ptr<keys::IKeyMaterialGenerator> generator = collaborators.generator;
    if (!generator) {
        generator = std::make_shared<keys::RsaKeyMaterialGenerator>(config_.keySizeBits, clock);
    }

    store_ = std::make_shared<keys::KeyStore>(config_.storePolicy(), clock);
    controller_ = std::make_unique<rotation::RotationController>(
        config_, store_, std::move(generator), clock, std::move(secretStore), events);
    issuer_ = std::make_unique<token::TokenIssuer>(store_, clock, config_.issuer, events);
    validator_ = std::make_unique<token::TokenValidator>(store_, clock, events);
    exporter_ = std::make_unique<token::JwksExporter>(store_);
}

KeyringService::~KeyringService() {
    if (controller_) {
        controller_->stop();
    }
}

void KeyringService::reportHealth(HealthStatus status) const {
    if (metrics_ != nullptr) {
        metrics_->setComponentHealth(kHealthComponent, status);
    }
}

KeyringResult<void> KeyringService::start() {
    auto bootstrapped = controller_->bootstrap();
    if (!bootstrapped) {
        reportHealth(HealthStatus::Unhealthy);
        KEYRING_LOG(foundation::LogLevel::Critical, LogCategory::Core,
                    "Keyring bootstrap failed: " + std::string(bootstrapped.error().message()));
        return bootstrapped;
    }

    if (!controller_->isRunning()) {
        auto started = controller_->start();
        if (!started && started.error().code() != ErrorCode::SchedulerAlreadyRunning) {
            reportHealth(HealthStatus::Degraded);
            return started;
        }
    }

    reportHealth(HealthStatus::Healthy);
    KEYRING_LOG_INFO(LogCategory::Core, "Keyring service started");
    return KeyringResult<void>::ok();
}

void KeyringService::stop() {
    if (!controller_->isRunning()) {
        return;
    }
    controller_->stop();
    // Existing keys still sign and verify; only rotation has stopped.
    reportHealth(HealthStatus::Degraded);
    KEYRING_LOG_INFO(LogCategory::Core, "Keyring service stopped");
}

bool KeyringService::isRunning() const {
    return controller_->isRunning();
}

KeyringResult<std::string> KeyringService::issue(token::Claims claims,
                                                 std::chrono::seconds lifetime) const {
    return issuer_->issue(std::move(claims), lifetime);
}

KeyringResult<std::string> KeyringService::issue(token::Claims claims) const {
    return issuer_->issue(std::move(claims), config_.defaultTokenLifetime);
}

KeyringResult<token::VerifiedToken> KeyringService::validate(std::string_view token,
                                                             bool checkExpiry) const {
    return validator_->validate(token, checkExpiry);
}

KeyringResult<std::string> KeyringService::exportJwks() const {
    return exporter_->exportJwks();
}

bool KeyringService::forceRotate() {
    return controller_->forceRotate();
}

bool KeyringService::emergencyRotate() {
    return controller_->emergencyRotate();
}

rotation::KeyHealth KeyringService::keyHealth() const {
    return controller_->keyHealth();
}

const rotation::RotationConfig& KeyringService::config() const {
    return config_;
}

rotation::RotationController& KeyringService::controller() {
    return *controller_;
}

}  // namespace keyring::service
