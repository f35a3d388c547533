#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the keyringd entry point.
///
/// Signal handling, config path resolution and loading, and ordered
/// shutdown hooks.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "keyring/foundation/config_manager.hpp"
#include "keyring/foundation/keyring_result.hpp"

namespace keyring::service {

/// Environment variable naming the config file.
inline constexpr const char* kConfigPathEnv = "KEYRING_CONFIG_PATH";

/// Config file used when neither --config nor KEYRING_CONFIG_PATH is given.
inline constexpr const char* kDefaultConfigPath = "/etc/keyring/keyring.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. The handler
/// only performs a relaxed store on a lock-free atomic. Destruction
/// restores the default handlers so a second signal terminates at once.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Set the shutdown flag as if a signal had arrived.
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Shutdown hook callback type.
using ShutdownHook = std::function<void()>;

/// Runs named shutdown hooks in registration order.
///
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("scheduler", [&]() { service.stop(); });
///   shutdown.addHook("logger",    [&]() { (void)KeyringLogger::instance().flush(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    /// Add a named shutdown hook.
    void addHook(std::string name, ShutdownHook hook);

    /// Execute all hooks in order. A hook that throws is logged and the
    /// remaining hooks still run. Hooks still running past the drain
    /// timeout are reported.
    void execute();

    [[nodiscard]] std::size_t hookCount() const;

    /// Budget for the whole shutdown sequence.
    void setDrainTimeout(std::chrono::seconds timeout);

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
};

/// Resolve the config file path: `--config <path>`, then
/// KEYRING_CONFIG_PATH, then @p defaultPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(int argc,
                                                      char* argv[],
                                                      const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Load a YAML configuration file into @p config.
///
/// @return Success or ConfigLoadFailed.
[[nodiscard]] foundation::KeyringResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& path);

}  // namespace keyring::service
