/// @file rotation_events.cpp
/// @brief MetricsEventSink implementation.

#include "keyring/rotation/rotation_events.hpp"

#include <string>

namespace keyring::rotation {

MetricsEventSink::MetricsEventSink(foundation::KeyringMetrics& metrics) : metrics_(metrics) {
    metrics_.registerHistogram(kKeyGenerationHistogram,
                               foundation::HistogramBuckets::keyGeneration());
}

std::string MetricsEventSink::counterName(RotationEvent event) {
    std::string name("keyring_");
    name.append(rotationEventName(event));
    name.append("_total");
    return name;
}

// Key ids are unbounded; they are not used as labels.
void MetricsEventSink::record(RotationEvent event, std::string_view /*keyId*/) {
    metrics_.incrementCounter(counterName(event));
}

void MetricsEventSink::recordGenerationLatency(std::chrono::milliseconds elapsed) {
    metrics_.recordHistogram(kKeyGenerationHistogram, static_cast<double>(elapsed.count()));
}

void MetricsEventSink::recordRetainedKeys(std::size_t count) {
    metrics_.setGauge(kRetainedKeysGauge, static_cast<double>(count));
}

}  // namespace keyring::rotation
