#pragma once

/// @file keyring_metrics.hpp
/// @brief KeyringMetrics for counters, gauges, histograms, component health
///        and Prometheus-compatible export.
///
/// Thread-safe in-memory storage behind PIMPL. The rotation subsystem only
/// emits counts into it; serving the scrape output is the caller's job.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keyring::foundation {

/// Bucket boundaries for histogram metrics.
///
/// Each boundary defines the upper bound of a bucket (le = "less than or equal").
struct HistogramBuckets {
    /// Default latency buckets in milliseconds: {1,5,10,25,50,100,250,500,1000}.
    static HistogramBuckets defaultLatency();

    /// Buckets suited to RSA key generation in milliseconds:
    /// {10,50,100,250,500,1000,2500,5000,10000}.
    static HistogramBuckets keyGeneration();

    std::vector<double> boundaries;
};

/// Overall health status of a component or the service itself.
enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy
};

/// Aggregated health check result for the service.
struct HealthCheckResult {
    HealthStatus status{HealthStatus::Healthy};
    std::string serviceName;
    std::unordered_map<std::string, HealthStatus> components;
    std::chrono::system_clock::time_point timestamp{};
};

/// Central metrics facade.
///
/// Counters and gauges use atomic operations; histograms and health maps
/// are mutex-protected. Non-copyable but movable (PIMPL).
///
/// Example:
/// @code
///   KeyringMetrics metrics;
///   metrics.incrementCounter("keyring_rotation_completed_total");
///   metrics.setGauge("keyring_retained_keys", 2.0);
///   std::string prom = metrics.scrape();
/// @endcode
class KeyringMetrics {
public:
    KeyringMetrics();
    ~KeyringMetrics();

    KeyringMetrics(const KeyringMetrics&) = delete;
    KeyringMetrics& operator=(const KeyringMetrics&) = delete;
    KeyringMetrics(KeyringMetrics&&) noexcept;
    KeyringMetrics& operator=(KeyringMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Increment a counter by the given value (default 1).
    /// Creates the counter on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Read the current counter value. Returns 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    /// Set a gauge to an absolute value. Creates the gauge on first use.
    void setGauge(std::string_view name, double value);

    /// Read the current gauge value. Returns 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    // ── Histograms ──────────────────────────────────────────────────────

    /// Register a histogram with the given bucket boundaries.
    /// Registering an existing name keeps the original buckets.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation in a previously registered histogram.
    /// No-op if the histogram has not been registered.
    void recordHistogram(std::string_view name, double value);

    /// Number of observations recorded in a histogram (0 if unknown).
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    // ── Health ──────────────────────────────────────────────────────────

    /// Set the health status of a named component.
    void setComponentHealth(std::string_view component, HealthStatus status);

    /// Aggregate component statuses; the worst component wins.
    [[nodiscard]] HealthCheckResult healthCheck() const;

    // ── Export ──────────────────────────────────────────────────────────

    /// Render all metrics in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear all metrics and health state.
    void reset();

    /// Get the process-wide metrics instance.
    static KeyringMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace keyring::foundation
