#pragma once

/// @file rotation_events.hpp
/// @brief Event sink for rotation, generation and validation counters.
///
/// The subsystem only emits counts. Owning a metrics backend is the
/// embedding application's job; MetricsEventSink forwards into
/// KeyringMetrics for the bundled daemon and for tests.

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "keyring/foundation/keyring_metrics.hpp"

namespace keyring::rotation {

/// Countable events emitted by the controller, issuer and validator.
enum class RotationEvent : uint8_t {
    KeyGenerated = 0,
    KeyGenerationFailed,
    RotationCompleted,
    RotationFailed,
    RotationCoalesced,
    StandbyDiscarded,
    KeyRetired,
    KeyExpired,
    KeyRemoved,
    KeyRestored,
    PersistFailed,
    TokenIssued,
    TokenIssueFailed,
    ValidationSucceeded,
    ValidationSignatureInvalid,
    ValidationExpired,
    ValidationMalformed
};

/// Total number of rotation events.
inline constexpr std::size_t kRotationEventCount = 17;

/// Snake-case name of an event, used in counter names.
constexpr std::string_view rotationEventName(RotationEvent event) {
    constexpr std::array<std::string_view, kRotationEventCount> names = {
        "key_generated",
        "key_generation_failed",
        "rotation_completed",
        "rotation_failed",
        "rotation_coalesced",
        "standby_discarded",
        "key_retired",
        "key_expired",
        "key_removed",
        "key_restored",
        "persist_failed",
        "token_issued",
        "token_issue_failed",
        "validation_succeeded",
        "validation_signature_invalid",
        "validation_expired",
        "validation_malformed"};
    auto idx = static_cast<std::size_t>(event);
    return idx < kRotationEventCount ? names[idx] : "unknown";
}

/// Receiver of subsystem events.
///
/// Called from issuing, validating and scheduler threads concurrently;
/// implementations must be thread-safe and must not block.
class IRotationEventSink {
public:
    virtual ~IRotationEventSink() = default;

    /// Count one occurrence of an event. @p keyId may be empty.
    virtual void record(RotationEvent event, std::string_view keyId) = 0;

    /// Time spent generating one key pair.
    virtual void recordGenerationLatency(std::chrono::milliseconds elapsed) = 0;

    /// Keys held by the store after a mutation.
    virtual void recordRetainedKeys(std::size_t count) = 0;
};

/// Sink that drops everything.
class NullEventSink final : public IRotationEventSink {
public:
    void record(RotationEvent, std::string_view) override {}
    void recordGenerationLatency(std::chrono::milliseconds) override {}
    void recordRetainedKeys(std::size_t) override {}
};

/// Sink that maps events onto KeyringMetrics.
///
/// | Event / call               | Metric                                  |
/// |----------------------------|-----------------------------------------|
/// | record(e)                  | counter `keyring_<event>_total`         |
/// | recordGenerationLatency    | histogram `keyring_key_generation_ms`   |
/// | recordRetainedKeys         | gauge `keyring_retained_keys`           |
class MetricsEventSink final : public IRotationEventSink {
public:
    explicit MetricsEventSink(foundation::KeyringMetrics& metrics);

    void record(RotationEvent event, std::string_view keyId) override;
    void recordGenerationLatency(std::chrono::milliseconds elapsed) override;
    void recordRetainedKeys(std::size_t count) override;

    /// Counter name for an event.
    [[nodiscard]] static std::string counterName(RotationEvent event);

private:
    foundation::KeyringMetrics& metrics_;
};

/// Metric names used by MetricsEventSink.
inline constexpr std::string_view kKeyGenerationHistogram = "keyring_key_generation_ms";
inline constexpr std::string_view kRetainedKeysGauge = "keyring_retained_keys";

}  // namespace keyring::rotation
