#pragma once

/// @file keyring_logger.hpp
/// @brief KeyringLogger wrapping kcenon logger_system for structured logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "keyring/foundation/keyring_result.hpp"

namespace keyring::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Service lifecycle
    KeyGen   = 1, ///< Key material generation
    KeyStore = 2, ///< Key state transitions and sweeps
    Rotation = 3, ///< Rotation controller and scheduler
    Token    = 4, ///< Issuance and validation
    Config   = 5  ///< Configuration loading and validation
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 6;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "KeyGen", "KeyStore", "Rotation", "Token", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Only key identifiers go here, never key material.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.keyId = "8a4c...";
///   ctx.rotationEpoch = 3;
///   logger.logWithContext(LogLevel::Info, LogCategory::Rotation,
///                         "Standby promoted", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> keyId;
    std::optional<uint64_t> rotationEpoch;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | KeyGen   | Info          |
/// | KeyStore | Info          |
/// | Rotation | Info          |
/// | Token    | Warning       |
/// | Config   | Info          |
///
/// Token defaults to Warning because validation runs on every request.
class KeyringLogger {
public:
    KeyringLogger();
    ~KeyringLogger();

    KeyringLogger(const KeyringLogger&) = delete;
    KeyringLogger& operator=(const KeyringLogger&) = delete;
    KeyringLogger(KeyringLogger&&) noexcept;
    KeyringLogger& operator=(KeyringLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    KeyringResult<void> flush();

    /// Get the process-wide logger instance.
    static KeyringLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace keyring::foundation

/// @name KEYRING_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// KEYRING_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef KEYRING_MIN_LOG_LEVEL
    #define KEYRING_MIN_LOG_LEVEL 0
#endif

#define KEYRING_LOG(level, cat, msg)                                                    \
    do {                                                                                \
        _Pragma("GCC diagnostic push")                                                  \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                             \
        if (static_cast<int>(level) >= KEYRING_MIN_LOG_LEVEL &&                         \
            ::keyring::foundation::KeyringLogger::instance().isEnabled((level), (cat)))  \
        {                                                                               \
            ::keyring::foundation::KeyringLogger::instance().log((level), (cat), (msg)); \
        }                                                                               \
        _Pragma("GCC diagnostic pop")                                                   \
    } while (0)

#define KEYRING_LOG_DEBUG(cat, msg) \
    KEYRING_LOG(::keyring::foundation::LogLevel::Debug, (cat), (msg))

#define KEYRING_LOG_INFO(cat, msg) \
    KEYRING_LOG(::keyring::foundation::LogLevel::Info, (cat), (msg))

#define KEYRING_LOG_WARN(cat, msg) \
    KEYRING_LOG(::keyring::foundation::LogLevel::Warning, (cat), (msg))

#define KEYRING_LOG_ERROR(cat, msg) \
    KEYRING_LOG(::keyring::foundation::LogLevel::Error, (cat), (msg))

/// @}
