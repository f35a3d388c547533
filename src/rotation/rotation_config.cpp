/// @file rotation_config.cpp
/// @brief RotationConfig loading and validation.

#include "keyring/rotation/rotation_config.hpp"

#include "keyring/foundation/keyring_logger.hpp"

#include <utility>

namespace keyring::rotation {

using foundation::ErrorCode;
using foundation::KeyringError;
using foundation::LogCategory;

namespace {

KeyringResult<std::vector<std::string>> invalid(std::string message) {
    return KeyringResult<std::vector<std::string>>::err(
        KeyringError(ErrorCode::InvalidConfig, std::move(message)));
}

}  // namespace

KeyringResult<RotationConfig> loadRotationConfig(const foundation::ConfigManager& config) {
    RotationConfig cfg;

    auto interval = config.getOr<int64_t>("keyring.rotation_interval_seconds",
                                          cfg.rotationInterval.count());
    if (!interval) {
        return KeyringResult<RotationConfig>::err(interval.error());
    }
    cfg.rotationInterval = std::chrono::seconds(interval.value());

    auto overlap =
        config.getOr<int64_t>("keyring.overlap_seconds", cfg.overlapDuration.count());
    if (!overlap) {
        return KeyringResult<RotationConfig>::err(overlap.error());
    }
    cfg.overlapDuration = std::chrono::seconds(overlap.value());

    auto keySize = config.getOr<uint32_t>("keyring.key_size_bits", cfg.keySizeBits);
    if (!keySize) {
        return KeyringResult<RotationConfig>::err(keySize.error());
    }
    cfg.keySizeBits = keySize.value();

    auto maxRetained = config.getOr<uint32_t>("keyring.max_retained_keys",
                                              static_cast<uint32_t>(cfg.maxRetainedKeys));
    if (!maxRetained) {
        return KeyringResult<RotationConfig>::err(maxRetained.error());
    }
    cfg.maxRetainedKeys = maxRetained.value();

    auto preGenerate = config.getOr<bool>("keyring.pregenerate_next_key", cfg.preGenerateNextKey);
    if (!preGenerate) {
        return KeyringResult<RotationConfig>::err(preGenerate.error());
    }
    cfg.preGenerateNextKey = preGenerate.value();

    auto grace = config.getOr<int64_t>("keyring.validation_grace_seconds",
                                       cfg.validationGracePeriod.count());
    if (!grace) {
        return KeyringResult<RotationConfig>::err(grace.error());
    }
    cfg.validationGracePeriod = std::chrono::seconds(grace.value());

    auto poll = config.getOr<int64_t>("keyring.max_poll_interval_ms", cfg.maxPollInterval.count());
    if (!poll) {
        return KeyringResult<RotationConfig>::err(poll.error());
    }
    cfg.maxPollInterval = std::chrono::milliseconds(poll.value());

    auto lifetime = config.getOr<int64_t>("keyring.default_token_lifetime_seconds",
                                          cfg.defaultTokenLifetime.count());
    if (!lifetime) {
        return KeyringResult<RotationConfig>::err(lifetime.error());
    }
    cfg.defaultTokenLifetime = std::chrono::seconds(lifetime.value());

    auto issuer = config.getOr<std::string>("keyring.issuer", cfg.issuer);
    if (!issuer) {
        return KeyringResult<RotationConfig>::err(issuer.error());
    }
    cfg.issuer = std::move(issuer).value();

    auto checked = validateRotationConfig(cfg);
    if (!checked) {
        KEYRING_LOG_ERROR(LogCategory::Config,
                          "Rejected keyring config: " + std::string(checked.error().message()));
        return KeyringResult<RotationConfig>::err(checked.error());
    }
    for (const auto& warning : checked.value()) {
        KEYRING_LOG_WARN(LogCategory::Config, warning);
    }
    return KeyringResult<RotationConfig>::ok(std::move(cfg));
}

KeyringResult<std::vector<std::string>> validateRotationConfig(const RotationConfig& config) {
    if (config.rotationInterval.count() <= 0) {
        return invalid("rotation_interval_seconds must be positive");
    }
    if (config.overlapDuration.count() <= 0) {
        return invalid("overlap_seconds must be positive");
    }
    if (config.validationGracePeriod.count() < 0) {
        return invalid("validation_grace_seconds must not be negative");
    }
    if (config.maxPollInterval.count() <= 0) {
        return invalid("max_poll_interval_ms must be positive");
    }
    if (config.defaultTokenLifetime.count() <= 0) {
        return invalid("default_token_lifetime_seconds must be positive");
    }
    if (config.keySizeBits < kMinKeySizeBits || config.keySizeBits % 8 != 0) {
        return invalid("key_size_bits must be a multiple of 8 and at least " +
                       std::to_string(kMinKeySizeBits));
    }
    if (config.maxRetainedKeys < 2) {
        return invalid("max_retained_keys must be at least 2 (active + standby)");
    }

    std::vector<std::string> warnings;
    if (config.keySizeBits < kRecommendedKeySizeBits) {
        warnings.push_back("key_size_bits " + std::to_string(config.keySizeBits) +
                           " is below the recommended " +
                           std::to_string(kRecommendedKeySizeBits));
    }
    if (config.overlapDuration > config.rotationInterval) {
        warnings.push_back(
            "overlap_seconds exceeds rotation_interval_seconds; several keys will be retiring "
            "at once");
    }
    if (config.preGenerateNextKey && config.maxRetainedKeys < 3) {
        warnings.push_back(
            "max_retained_keys below 3 with pregeneration leaves no room for a retiring key");
    }
    if (config.defaultTokenLifetime > config.overlapDuration + config.validationGracePeriod) {
        warnings.push_back(
            "default_token_lifetime_seconds exceeds overlap + grace; tokens can outlive their "
            "signing key");
    }
    return KeyringResult<std::vector<std::string>>::ok(std::move(warnings));
}

}  // namespace keyring::rotation
