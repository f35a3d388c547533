/// @file clock.cpp
/// @brief SystemClock implementation.

#include "keyring/foundation/clock.hpp"

namespace keyring::foundation {

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

std::shared_ptr<const Clock> systemClock() {
    static const auto clock = std::make_shared<const SystemClock>();
    return clock;
}

} // namespace keyring::foundation
