#pragma once

/// @file clock.hpp
/// @brief Injectable wall-clock source.
///
/// Every time-dependent decision in the rotation subsystem (eligibility
/// windows, token expiry, rotation deadlines) reads time through this
/// interface so tests can drive it deterministically.

#include <chrono>
#include <cstdint>
#include <memory>

namespace keyring::foundation {

using TimePoint = std::chrono::system_clock::time_point;

/// Source of wall-clock time. Implementations must be thread-safe.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Clock backed by std::chrono::system_clock.
class SystemClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
};

/// Shared SystemClock used when no clock is injected.
[[nodiscard]] std::shared_ptr<const Clock> systemClock();

/// Convert a time point to whole seconds since the Unix epoch.
[[nodiscard]] inline int64_t toEpochSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

/// Convert whole seconds since the Unix epoch to a time point.
[[nodiscard]] inline TimePoint fromEpochSeconds(int64_t epoch) {
    return TimePoint(std::chrono::seconds(epoch));
}

} // namespace keyring::foundation
