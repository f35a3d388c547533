#pragma once

/// @file recording_event_sink.hpp
/// @brief Event sink that counts what it receives.

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string_view>

#include "keyring/rotation/rotation_events.hpp"

namespace keyring::test_support {

class RecordingEventSink : public rotation::IRotationEventSink {
public:
    void record(rotation::RotationEvent event, std::string_view /*keyId*/) override {
        counts_[static_cast<std::size_t>(event)].fetch_add(1);
    }

    void recordGenerationLatency(std::chrono::milliseconds /*elapsed*/) override {
        latencies_.fetch_add(1);
    }

    void recordRetainedKeys(std::size_t count) override { retained_.store(count); }

    [[nodiscard]] std::size_t count(rotation::RotationEvent event) const {
        return counts_[static_cast<std::size_t>(event)].load();
    }

    [[nodiscard]] std::size_t latencySamples() const { return latencies_.load(); }
    [[nodiscard]] std::size_t retainedKeys() const { return retained_.load(); }

private:
    std::array<std::atomic<std::size_t>, rotation::kRotationEventCount> counts_{};
    std::atomic<std::size_t> latencies_{0};
    std::atomic<std::size_t> retained_{0};
};

}  // namespace keyring::test_support
