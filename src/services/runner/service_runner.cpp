/// @file service_runner.cpp
/// @brief Implementation of the keyringd process plumbing.

#include "keyring/service/service_runner.hpp"

#include "keyring/foundation/keyring_logger.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

namespace keyring::service {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    const auto deadline = std::chrono::steady_clock::now() + drainTimeout_;
    for (const auto& hook : hooks_) {
        if (std::chrono::steady_clock::now() > deadline) {
            KEYRING_LOG_WARN(LogCategory::Core,
                             "Shutdown drain timeout exceeded before hook '" + hook.name + "'");
        }
        try {
            hook.callback();
        } catch (const std::exception& e) {
            KEYRING_LOG_ERROR(LogCategory::Core,
                              "Shutdown hook '" + hook.name + "' failed: " + e.what());
        }
    }
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config path and loading -------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path resolveConfigPath(int argc,
                                        char* argv[],
                                        const std::filesystem::path& defaultPath) {
    auto fromArgs = parseConfigArg(argc, argv);
    if (!fromArgs.empty()) {
        return fromArgs;
    }
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return defaultPath;
}

foundation::KeyringResult<void> loadConfig(foundation::ConfigManager& config,
                                           const std::filesystem::path& path) {
    auto result = config.load(path);
    if (result) {
        KEYRING_LOG_INFO(LogCategory::Config, "Loaded config " + path.string());
    }
    return result;
}

}  // namespace keyring::service
